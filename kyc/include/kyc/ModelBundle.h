#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Artifacts.h"
#include "Common.h"
#include "Log.h"
#include "Metrics.h"

namespace kyc {

enum class Capability : uint8_t {
  Full = 0,
  Partial = 1,
  ClassifierOnly = 2,
  Unavailable = 3,
};

std::string_view to_string(Capability c);

enum class PlanStep : uint8_t {
  Select = 0,
  Scale = 1,
  Classify = 2,
};

struct ModelBundleConfig {
  // Empty path: artifact absent.
  std::string classifier_path;
  std::string selector_path;
  std::string scaler_path;
  std::string fallback_path;
  // Used when nothing else can score a record. Kept strictly inside (0, 1).
  double safe_default_probability{0.50};
};

struct ModelArtifacts {
  std::unique_ptr<IClassifier> classifier;
  std::optional<FeatureSelector> selector;
  std::optional<StandardScaler> scaler;
  std::optional<FallbackTable> fallback;
};

struct ScoreResult {
  double probability{0.5}; // 0..1
  ScoreSource source{ScoreSource::Default};
  bool degraded{false};
  std::string degrade_reason;
};

struct ScoreTrace {
  FeatureVector raw;
  std::optional<FeatureVector> selected;
  std::optional<FeatureVector> scaled;
  ScoreResult result{};
};

struct BundleStatus {
  Capability capability{Capability::Unavailable};
  bool classifier_loaded{false};
  bool selector_loaded{false};
  bool scaler_loaded{false};
  std::string classifier_kind;
  std::string plan;
  size_t fallback_entries{0};
};

// Loaded once, then shared read-only by every request. The scoring plan is
// fixed when the bundle is built; score() never re-evaluates it. Log and
// metric sinks are borrowed and must outlive the bundle.
class ModelBundle {
  struct Key {
    explicit Key() = default;
  };

 public:
  static std::shared_ptr<const ModelBundle> load(const ModelBundleConfig& cfg,
                                                 ILogSink* log = nullptr,
                                                 IMetricSink* metrics = nullptr);
  static std::shared_ptr<const ModelBundle> from_artifacts(ModelArtifacts artifacts,
                                                           const ModelBundleConfig& cfg = {},
                                                           ILogSink* log = nullptr,
                                                           IMetricSink* metrics = nullptr);

  // Never throws. Falls back to the precomputed table (keyed by document
  // number) and then to the safe default when the plan cannot produce a value.
  ScoreResult score(const FeatureVector& x, std::string_view document_number = {}) const;
  double probability(const FeatureVector& x) const { return score(x).probability; }
  ScoreTrace trace(const FeatureVector& x, std::string_view document_number = {}) const;

  Capability capability() const { return capability_; }
  const std::vector<PlanStep>& plan() const { return plan_; }
  BundleStatus status() const;

  // Reachable only through load() and from_artifacts().
  ModelBundle(Key, ModelArtifacts artifacts, const ModelBundleConfig& cfg, ILogSink* log, IMetricSink* metrics);
  ModelBundle(const ModelBundle&) = delete;
  ModelBundle& operator=(const ModelBundle&) = delete;

 private:

  void choose_plan();
  bool run_plan(const FeatureVector& x, double& p, ScoreTrace* trace, std::string& why) const;
  ScoreResult resolve_unavailable(std::string_view document_number, std::string reason) const;

  ModelArtifacts artifacts_;
  double safe_default_{0.5};
  ILogSink* log_{nullptr};
  IMetricSink* metrics_{nullptr};
  std::vector<PlanStep> plan_;
  Capability capability_{Capability::Unavailable};
};

std::string describe_plan(const std::vector<PlanStep>& plan);

} // namespace kyc
