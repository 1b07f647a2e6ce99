#include "kyc/RiskClassifier.h"
#include "kyc/Util.h"
#include <cmath>

namespace kyc {

RiskClassifier::RiskClassifier(const RiskThresholds& cfg) : cfg_(cfg) {}

RiskLevel RiskClassifier::level_for(double p) const {
  if (p < cfg_.low_upper) return RiskLevel::Low;
  if (p > cfg_.high_lower) return RiskLevel::High;
  return RiskLevel::Medium;
}

RiskScore RiskClassifier::classify(double probability) const {
  if (std::isnan(probability)) probability = 0.5;
  return classify_percent(probability * 100.0);
}

RiskScore RiskClassifier::classify_percent(double p) const {
  if (std::isnan(p)) p = 50.0;
  if (p < 0.0) p = 0.0;
  if (p > 100.0) p = 100.0;
  // Rounded first so a value read back from the audit log lands in the same tier.
  p = round2(p);

  RiskScore out{};
  out.fraud_probability = p;
  out.risk_level = level_for(p);
  out.status = status_for(out.risk_level);
  double c = 100.0 - p;
  out.confidence = c < 0.0 ? 0.0 : (c > 100.0 ? 100.0 : c);
  return out;
}

ResultDetails RiskClassifier::details(const RiskScore& score, std::string_view address) const {
  ResultDetails d{};
  d.document_authenticity = score.risk_level == RiskLevel::High ? "Suspicious" : "Valid";
  d.address_verification = trim(address).size() >= cfg_.address_verified_min_len ? "Verified" : "Pending";
  d.anomaly_score = format_fixed2(score.fraud_probability);
  return d;
}

} // namespace kyc
