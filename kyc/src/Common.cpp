#include "kyc/Common.h"
#include "kyc/Util.h"

namespace kyc {

std::string_view to_string(DocumentType t) {
  switch (t) {
    case DocumentType::Aadhar: return "AADHAR";
    case DocumentType::Pan: return "PAN";
    case DocumentType::Utility: return "UTILITY";
  }
  return "UNKNOWN";
}

std::optional<DocumentType> parse_document_type(std::string_view text) {
  std::string t = to_upper(trim(text));
  if (t == "AADHAR") return DocumentType::Aadhar;
  if (t == "PAN") return DocumentType::Pan;
  if (t == "UTILITY") return DocumentType::Utility;
  return std::nullopt;
}

std::string_view to_string(RiskLevel r) {
  switch (r) {
    case RiskLevel::Low: return "Low";
    case RiskLevel::Medium: return "Medium";
    case RiskLevel::High: return "High";
  }
  return "Unknown";
}

std::string_view to_string(Status s) {
  return s == Status::Flagged ? "Flagged" : "Verified";
}

std::optional<RiskLevel> parse_risk_level(std::string_view text) {
  std::string_view t = trim(text);
  if (t == "Low") return RiskLevel::Low;
  if (t == "Medium") return RiskLevel::Medium;
  if (t == "High") return RiskLevel::High;
  return std::nullopt;
}

std::string_view to_string(ScoreSource s) {
  switch (s) {
    case ScoreSource::Model: return "model";
    case ScoreSource::Fallback: return "fallback";
    case ScoreSource::Default: return "default";
  }
  return "unknown";
}

std::string_view to_string(ErrorKind e) {
  switch (e) {
    case ErrorKind::None: return "none";
    case ErrorKind::Validation: return "validation";
    case ErrorKind::Persistence: return "persistence";
    case ErrorKind::MalformedRow: return "malformed_row";
    case ErrorKind::MalformedBatch: return "malformed_batch";
    case ErrorKind::Internal: return "internal";
  }
  return "unknown";
}

} // namespace kyc
