#pragma once
#include "Common.h"
#include "Validation.h"

namespace kyc {

enum class Feature : uint8_t {
  NameLength = 0,
  DocumentNumberLength,
  AddressLength,
  AddressWords,
  DocumentTypeCode,
  DocumentWellFormed,
  NameUppercase,
  NameDigits,
};

// Keeps its own copy of the validator set; the validators it points to are
// still borrowed.
class FeatureExtractor {
 public:
  explicit FeatureExtractor(const DocumentValidatorSet& validators = DocumentValidatorSet::defaults());

  // Never fails: always kFeatureCount values in Feature order.
  FeatureVector extract(const IdentityRecord& rec) const;

 private:
  DocumentValidatorSet validators_;
};

inline double feature_at(const FeatureVector& v, Feature f) {
  return v[static_cast<size_t>(f)];
}

} // namespace kyc
