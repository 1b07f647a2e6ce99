#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kyc {

using TimeMs = uint64_t;

// Fixed order, shared with the training side:
// name_len, doc_len, addr_len, addr_words, doc_type, doc_well_formed, name_upper, name_digits
constexpr size_t kFeatureCount = 8;
using FeatureVector = std::vector<double>;

enum class DocumentType : uint8_t {
  Aadhar = 0,
  Pan = 1,
  Utility = 2,
};

constexpr size_t kDocumentTypeCount = 3;

std::string_view to_string(DocumentType t);
std::optional<DocumentType> parse_document_type(std::string_view text);

// As received from the caller, nothing checked yet.
struct IdentityInput {
  std::string name;
  std::string document_number;
  std::string address;
  std::string document_type;
};

struct IdentityRecord {
  std::string name;
  std::string document_number;
  std::string address;
  DocumentType document_type{DocumentType::Aadhar};
};

enum class RiskLevel : uint8_t {
  Low = 0,
  Medium = 1,
  High = 2,
};

enum class Status : uint8_t {
  Verified = 0,
  Flagged = 1,
};

std::string_view to_string(RiskLevel r);
std::string_view to_string(Status s);
std::optional<RiskLevel> parse_risk_level(std::string_view text);

inline Status status_for(RiskLevel r) {
  return r == RiskLevel::High ? Status::Flagged : Status::Verified;
}

struct RiskScore {
  double fraud_probability{0.0}; // percent, 2 decimals
  RiskLevel risk_level{RiskLevel::Low};
  double confidence{100.0};
  Status status{Status::Verified};
};

enum class ScoreSource : uint8_t {
  Model = 0,
  Fallback = 1,
  Default = 2,
};

std::string_view to_string(ScoreSource s);

struct ResultDetails {
  std::string document_authenticity;
  std::string address_verification;
  std::string anomaly_score;
};

struct VerificationResult {
  std::string id;
  std::string timestamp;
  IdentityRecord record{};
  RiskScore score{};
  ResultDetails details{};
  ScoreSource source{ScoreSource::Model};
  bool degraded{false};
};

enum class ErrorKind : uint8_t {
  None = 0,
  Validation,
  Persistence,
  MalformedRow,
  MalformedBatch,
  Internal,
};

std::string_view to_string(ErrorKind e);

struct Error {
  ErrorKind kind{ErrorKind::None};
  std::string message;

  bool ok() const { return kind == ErrorKind::None; }
};

} // namespace kyc
