#pragma once
#include <atomic>
#include <memory>
#include <string_view>
#include "AuditLog.h"
#include "Common.h"
#include "FeatureExtractor.h"
#include "Log.h"
#include "Metrics.h"
#include "ModelBundle.h"
#include "RiskClassifier.h"
#include "Validation.h"

namespace kyc {

enum class PipelineState : uint8_t {
  Received = 0,
  FeaturesExtracted,
  Scored,
  Classified,
  Logged,
  Completed,
  Rejected,
  DegradedCompleted,
};

std::string_view to_string(PipelineState s);

struct PipelineConfig {
  ValidationConfig validation{};
  RiskThresholds risk{};
};

struct VerifyOutcome {
  bool ok{false};
  PipelineState state{PipelineState::Received};
  Error error{};
  // Filled once scoring ran, also when the audit append then failed.
  VerificationResult result{};
};

// Received -> FeaturesExtracted -> Scored -> Classified -> Logged -> Completed.
// Rejected when validation fails (nothing scored, nothing logged).
// DegradedCompleted when the bundle could not use the model but the record
// was still scored and logged. A failed audit append fails the request.
// Safe to call concurrently; the bundle and audit log must outlive it.
class VerificationPipeline {
 public:
  VerificationPipeline(const PipelineConfig& cfg,
                       std::shared_ptr<const ModelBundle> bundle,
                       AuditLog& audit,
                       ILogSink* log = nullptr,
                       IMetricSink* metrics = nullptr,
                       const DocumentValidatorSet& validators = DocumentValidatorSet::defaults());

  VerifyOutcome verify(const IdentityInput& in);
  VerifyOutcome verify(const IdentityInput& in, TimeMs now_ms);

  const ModelBundle& bundle() const { return *bundle_; }
  const RiskClassifier& classifier() const { return classifier_; }
  const FeatureExtractor& extractor() const { return extractor_; }

 private:
  std::string next_id(TimeMs now_ms);

  PipelineConfig cfg_{};
  std::shared_ptr<const ModelBundle> bundle_;
  AuditLog& audit_;
  ILogSink* log_{nullptr};
  IMetricSink* metrics_{nullptr};
  FeatureExtractor extractor_;
  RiskClassifier classifier_;
  std::atomic<uint64_t> seq_{0};
};

} // namespace kyc
