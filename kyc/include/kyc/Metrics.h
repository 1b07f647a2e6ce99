#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kyc {

struct MetricLabel {
  std::string key;
  std::string value;
};

// Names emitted by the library:
//   kyc_verify_total{outcome}            completed | degraded | rejected | persistence_error
//   kyc_scoring_degraded_total{reason}   unavailable | model_error
//   kyc_fraud_probability_histogram      stored probability percentage
//   kyc_model_capability                 gauge, Capability as a number
//   kyc_audit_append_fail_total{reason}  open | stat | read | write | sync
//   kyc_batch_rows_total{outcome}        ok or the ErrorKind name
// Implementations must be safe to call from concurrent requests.
class IMetricSink {
 public:
  virtual ~IMetricSink() = default;
  virtual void inc_counter(std::string_view name, uint64_t value = 1,
                           const std::vector<MetricLabel>& labels = {}) = 0;
  virtual void set_gauge(std::string_view name, double value,
                         const std::vector<MetricLabel>& labels = {}) = 0;
  virtual void observe_histogram(std::string_view name, double value,
                                 const std::vector<MetricLabel>& labels = {}) = 0;
};

class NoopMetricSink final : public IMetricSink {
 public:
  void inc_counter(std::string_view, uint64_t, const std::vector<MetricLabel>&) override {}
  void set_gauge(std::string_view, double, const std::vector<MetricLabel>&) override {}
  void observe_histogram(std::string_view, double, const std::vector<MetricLabel>&) override {}
};

NoopMetricSink& noop_metrics();

} // namespace kyc
