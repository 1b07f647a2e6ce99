#include "kyc/FeatureExtractor.h"
#include "kyc/Util.h"

namespace kyc {

FeatureExtractor::FeatureExtractor(const DocumentValidatorSet& validators) : validators_(validators) {}

FeatureVector FeatureExtractor::extract(const IdentityRecord& rec) const {
  FeatureVector x(kFeatureCount, 0.0);
  size_t upper = 0;
  size_t digits = 0;
  for (char c : rec.name) {
    if (c >= 'A' && c <= 'Z') ++upper;
    else if (c >= '0' && c <= '9') ++digits;
  }

  x[static_cast<size_t>(Feature::NameLength)] = static_cast<double>(rec.name.size());
  x[static_cast<size_t>(Feature::DocumentNumberLength)] = static_cast<double>(rec.document_number.size());
  x[static_cast<size_t>(Feature::AddressLength)] = static_cast<double>(rec.address.size());
  x[static_cast<size_t>(Feature::AddressWords)] = static_cast<double>(word_count(rec.address));
  x[static_cast<size_t>(Feature::DocumentTypeCode)] = static_cast<double>(static_cast<uint8_t>(rec.document_type));
  x[static_cast<size_t>(Feature::DocumentWellFormed)] =
      validators_.well_formed(rec.document_type, rec.document_number) ? 1.0 : 0.0;
  x[static_cast<size_t>(Feature::NameUppercase)] = static_cast<double>(upper);
  x[static_cast<size_t>(Feature::NameDigits)] = static_cast<double>(digits);
  return x;
}

} // namespace kyc
