#pragma once
#include <cstddef>
#include <string_view>
#include "Common.h"

namespace kyc {

// Percent thresholds. Both boundaries belong to Medium:
// p < low_upper is Low, p > high_lower is High.
struct RiskThresholds {
  double low_upper{33.0};
  double high_lower{67.0};
  size_t address_verified_min_len{11};
};

class RiskClassifier {
 public:
  explicit RiskClassifier(const RiskThresholds& cfg = {});

  // probability in 0..1; out-of-range values are clamped, NaN counts as 0.5.
  RiskScore classify(double probability) const;
  RiskScore classify_percent(double p) const;
  RiskLevel level_for(double p) const;
  ResultDetails details(const RiskScore& score, std::string_view address) const;

  const RiskThresholds& thresholds() const { return cfg_; }

 private:
  RiskThresholds cfg_{};
};

} // namespace kyc
