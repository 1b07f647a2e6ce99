#pragma once
#include <array>
#include <cstddef>
#include <string_view>
#include "Common.h"

namespace kyc {

class IDocumentNumberValidator {
 public:
  virtual ~IDocumentNumberValidator() = default;
  virtual bool well_formed(std::string_view number) const = 0;
};

// 12 digits.
class AadharNumberValidator final : public IDocumentNumberValidator {
 public:
  bool well_formed(std::string_view number) const override;
};

// AAAAA9999A
class PanNumberValidator final : public IDocumentNumberValidator {
 public:
  bool well_formed(std::string_view number) const override;
};

// Account/consumer numbers vary by provider; accept 6-20 alphanumerics or '-'.
class UtilityNumberValidator final : public IDocumentNumberValidator {
 public:
  bool well_formed(std::string_view number) const override;
};

// Borrowed validators must outlive the set.
class DocumentValidatorSet {
 public:
  DocumentValidatorSet();

  void set(DocumentType t, const IDocumentNumberValidator* v);
  bool well_formed(DocumentType t, std::string_view number) const;

  static const DocumentValidatorSet& defaults();

 private:
  std::array<const IDocumentNumberValidator*, kDocumentTypeCount> validators_{};
};

struct ValidationConfig {
  size_t max_name_len{256};
  size_t max_document_number_len{64};
  size_t max_address_len{1024};
};

struct ValidationResult {
  bool ok{false};
  Error error{};
  IdentityRecord record{};
};

// Trims every field and resolves the document type. Rejects a missing name or
// document number, an unsupported document type and oversized fields.
ValidationResult validate_identity(const IdentityInput& in, const ValidationConfig& cfg = {});

} // namespace kyc
