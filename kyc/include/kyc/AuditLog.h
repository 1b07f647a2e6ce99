#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include "Common.h"
#include "Log.h"
#include "Metrics.h"
#include "RiskClassifier.h"

namespace kyc {

// One CSV line per scored record:
// Timestamp,Name,Document_Number,ID_Type,Fraud_Probability,Fraud_Risk_Level,Confidence
struct AuditEntry {
  std::string timestamp;
  std::string name;
  std::string document_number;
  std::string id_type;
  double fraud_probability{0.0}; // percent
  RiskLevel risk_level{RiskLevel::Low};
  double confidence{100.0};
};

extern const char* const kAuditHeader;

struct AuditLogConfig {
  std::string path{"kyc_audit_log.csv"};
  bool sync_on_append{false};
};

struct AppendResult {
  bool ok{false};
  std::string error;
};

struct ReadStats {
  bool ok{true};
  std::string error;
  size_t lines{0};
  size_t entries{0};
  size_t skipped{0};
};

// Append-only. Appends from any number of threads are serialized and each
// entry reaches the file in a single write(2) on an O_APPEND descriptor, so
// readers never see interleaved entries. Nothing here edits or removes lines.
class AuditLog {
 public:
  explicit AuditLog(const AuditLogConfig& cfg, ILogSink* log = nullptr, IMetricSink* metrics = nullptr);
  ~AuditLog();

  AuditLog(const AuditLog&) = delete;
  AuditLog& operator=(const AuditLog&) = delete;

  AppendResult append(const AuditEntry& entry);

  // Newest first. Malformed lines and an unterminated trailing line are
  // skipped and counted in stats. A missing file reads as empty.
  std::vector<AuditEntry> read_all(ReadStats* stats = nullptr) const;
  std::vector<VerificationResult> history(ReadStats* stats = nullptr) const;

  const std::string& path() const { return cfg_.path; }

 private:
  bool ensure_open(std::string& error);
  void close_fd();

  AuditLogConfig cfg_{};
  ILogSink* log_{nullptr};
  IMetricSink* metrics_{nullptr};
  mutable std::mutex mu_;
  int fd_{-1};
};

std::string encode_audit_line(const AuditEntry& e);
// Canonical column order; use parse_audit_text for files with a header.
bool decode_audit_line(std::string_view line, AuditEntry& out);
std::vector<AuditEntry> parse_audit_text(std::string_view text, ReadStats* stats = nullptr);

AuditEntry to_audit_entry(const VerificationResult& r);
// Status, id and details are recomputed; address is not part of the log.
VerificationResult from_audit_entry(const AuditEntry& e, const RiskClassifier& classifier = RiskClassifier{});

struct HistoryStats {
  size_t total{0};
  size_t verified{0};
  size_t flagged{0};
  size_t low{0};
  size_t medium{0};
  size_t high{0};
};

HistoryStats summarize(const std::vector<VerificationResult>& history);

} // namespace kyc
