#include "kyc/Validation.h"
#include "kyc/Util.h"
#include <string>

namespace kyc {

namespace {
bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
bool is_alnum(char c) { return is_digit(c) || is_upper(c) || (c >= 'a' && c <= 'z'); }

const AadharNumberValidator kAadhar{};
const PanNumberValidator kPan{};
const UtilityNumberValidator kUtility{};

ValidationResult reject(std::string message) {
  ValidationResult res{};
  res.ok = false;
  res.error = Error{ErrorKind::Validation, std::move(message)};
  return res;
}
} // namespace

bool AadharNumberValidator::well_formed(std::string_view number) const {
  if (number.size() != 12) return false;
  for (char c : number) {
    if (!is_digit(c)) return false;
  }
  return true;
}

bool PanNumberValidator::well_formed(std::string_view number) const {
  if (number.size() != 10) return false;
  for (size_t i = 0; i < 5; ++i) {
    if (!is_upper(number[i])) return false;
  }
  for (size_t i = 5; i < 9; ++i) {
    if (!is_digit(number[i])) return false;
  }
  return is_upper(number[9]);
}

bool UtilityNumberValidator::well_formed(std::string_view number) const {
  if (number.size() < 6 || number.size() > 20) return false;
  for (char c : number) {
    if (!is_alnum(c) && c != '-') return false;
  }
  return true;
}

DocumentValidatorSet::DocumentValidatorSet() {
  validators_[static_cast<size_t>(DocumentType::Aadhar)] = &kAadhar;
  validators_[static_cast<size_t>(DocumentType::Pan)] = &kPan;
  validators_[static_cast<size_t>(DocumentType::Utility)] = &kUtility;
}

void DocumentValidatorSet::set(DocumentType t, const IDocumentNumberValidator* v) {
  validators_[static_cast<size_t>(t)] = v;
}

bool DocumentValidatorSet::well_formed(DocumentType t, std::string_view number) const {
  const IDocumentNumberValidator* v = validators_[static_cast<size_t>(t)];
  return v ? v->well_formed(number) : false;
}

const DocumentValidatorSet& DocumentValidatorSet::defaults() {
  static const DocumentValidatorSet set{};
  return set;
}

ValidationResult validate_identity(const IdentityInput& in, const ValidationConfig& cfg) {
  std::string_view name = trim(in.name);
  std::string_view doc = trim(in.document_number);
  std::string_view addr = trim(in.address);

  if (name.empty()) return reject("name is required");
  if (doc.empty()) return reject("documentNumber is required");
  if (trim(in.document_type).empty()) return reject("documentType is required");

  auto type = parse_document_type(in.document_type);
  if (!type) {
    return reject("unsupported documentType '" + std::string(trim(in.document_type)) +
                  "' (expected AADHAR, PAN or UTILITY)");
  }
  if (name.size() > cfg.max_name_len) return reject("name exceeds " + std::to_string(cfg.max_name_len) + " bytes");
  if (doc.size() > cfg.max_document_number_len) {
    return reject("documentNumber exceeds " + std::to_string(cfg.max_document_number_len) + " bytes");
  }
  if (addr.size() > cfg.max_address_len) {
    return reject("address exceeds " + std::to_string(cfg.max_address_len) + " bytes");
  }

  ValidationResult res{};
  res.ok = true;
  res.record.name = std::string(name);
  res.record.document_number = std::string(doc);
  res.record.address = std::string(addr);
  res.record.document_type = *type;
  return res;
}

} // namespace kyc
