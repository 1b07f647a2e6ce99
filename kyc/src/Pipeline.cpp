#include "kyc/Pipeline.h"
#include "kyc/Util.h"

namespace kyc {

namespace {
constexpr std::string_view kComponent = "pipeline";
}

std::string_view to_string(PipelineState s) {
  switch (s) {
    case PipelineState::Received: return "received";
    case PipelineState::FeaturesExtracted: return "features_extracted";
    case PipelineState::Scored: return "scored";
    case PipelineState::Classified: return "classified";
    case PipelineState::Logged: return "logged";
    case PipelineState::Completed: return "completed";
    case PipelineState::Rejected: return "rejected";
    case PipelineState::DegradedCompleted: return "degraded_completed";
  }
  return "unknown";
}

VerificationPipeline::VerificationPipeline(const PipelineConfig& cfg,
                                           std::shared_ptr<const ModelBundle> bundle,
                                           AuditLog& audit,
                                           ILogSink* log,
                                           IMetricSink* metrics,
                                           const DocumentValidatorSet& validators)
    : cfg_(cfg),
      bundle_(std::move(bundle)),
      audit_(audit),
      log_(log ? log : &noop_log()),
      metrics_(metrics ? metrics : &noop_metrics()),
      extractor_(validators),
      classifier_(cfg.risk) {
  if (!bundle_) {
    // No bundle at all behaves like an empty one.
    bundle_ = ModelBundle::from_artifacts(ModelArtifacts{}, ModelBundleConfig{}, log_, metrics_);
  }
}

std::string VerificationPipeline::next_id(TimeMs now_ms) {
  uint64_t seq = seq_.fetch_add(1, std::memory_order_relaxed);
  return "VER" + std::to_string(now_ms) + "-" + std::to_string(seq);
}

VerifyOutcome VerificationPipeline::verify(const IdentityInput& in) {
  return verify(in, now_ms());
}

VerifyOutcome VerificationPipeline::verify(const IdentityInput& in, TimeMs now_ms) {
  VerifyOutcome out{};
  out.state = PipelineState::Received;

  auto v = validate_identity(in, cfg_.validation);
  if (!v.ok) {
    out.state = PipelineState::Rejected;
    out.error = v.error;
    metrics_->inc_counter("kyc_verify_total", 1, {{"outcome", "rejected"}});
    log_->log(LogLevel::Debug, kComponent, "rejected: " + v.error.message);
    return out;
  }

  FeatureVector x = extractor_.extract(v.record);
  out.state = PipelineState::FeaturesExtracted;

  ScoreResult s = bundle_->score(x, v.record.document_number);
  out.state = PipelineState::Scored;

  VerificationResult& r = out.result;
  r.id = next_id(now_ms);
  r.timestamp = format_iso8601(now_ms);
  r.record = std::move(v.record);
  r.score = classifier_.classify(s.probability);
  r.details = classifier_.details(r.score, r.record.address);
  r.source = s.source;
  r.degraded = s.degraded;
  out.state = PipelineState::Classified;
  metrics_->observe_histogram("kyc_fraud_probability_histogram", r.score.fraud_probability);

  AppendResult ar = audit_.append(to_audit_entry(r));
  if (!ar.ok) {
    out.error = Error{ErrorKind::Persistence, "audit log write failed: " + ar.error};
    metrics_->inc_counter("kyc_verify_total", 1, {{"outcome", "persistence_error"}});
    return out;
  }
  out.state = PipelineState::Logged;

  out.ok = true;
  out.state = r.degraded ? PipelineState::DegradedCompleted : PipelineState::Completed;
  metrics_->inc_counter("kyc_verify_total", 1,
                        {{"outcome", r.degraded ? "degraded" : "completed"}});
  return out;
}

} // namespace kyc
