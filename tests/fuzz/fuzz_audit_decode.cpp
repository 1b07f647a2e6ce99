#include "kyc/AuditLog.h"
#include <cstddef>
#include <cstdint>
#include <string_view>

using namespace kyc;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  std::string_view text(reinterpret_cast<const char*>(data), size);
  ReadStats st{};
  auto entries = parse_audit_text(text, &st);
  if (entries.size() != st.entries || st.entries + st.skipped > st.lines) __builtin_trap();

  // Whatever decodes must encode back to a line that decodes the same way.
  for (const auto& e : entries) {
    AuditEntry back{};
    if (!decode_audit_line(encode_audit_line(e), back)) __builtin_trap();
    if (back.risk_level != e.risk_level || back.id_type != e.id_type) __builtin_trap();
  }
  return 0;
}
