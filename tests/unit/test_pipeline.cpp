#include "kyc/Pipeline.h"
#include "kyc/Util.h"
#include "test_support.h"
#include <cassert>

using namespace kyc;
using kyc_test::near;

namespace {

IdentityInput john_doe() {
  IdentityInput in{};
  in.name = "John Doe";
  in.document_number = "123456789012";
  in.address = "123 Main St, Springfield";
  in.document_type = "AADHAR";
  return in;
}

class CountingMetrics final : public IMetricSink {
 public:
  void inc_counter(std::string_view name, uint64_t value, const std::vector<MetricLabel>& labels) override {
    if (name != "kyc_verify_total" || labels.empty()) return;
    if (labels[0].value == "rejected") rejected += value;
    else if (labels[0].value == "degraded") degraded += value;
    else if (labels[0].value == "completed") completed += value;
    else if (labels[0].value == "persistence_error") persistence += value;
  }
  void set_gauge(std::string_view, double, const std::vector<MetricLabel>&) override {}
  void observe_histogram(std::string_view, double, const std::vector<MetricLabel>&) override {}

  uint64_t rejected{0};
  uint64_t degraded{0};
  uint64_t completed{0};
  uint64_t persistence{0};
};

} // namespace

void test_pipeline() {
  std::string path = kyc_test::temp_path("pipeline");

  // No model artifacts at all: scored at the safe default and still logged.
  {
    AuditLogConfig acfg{};
    acfg.path = path;
    AuditLog audit(acfg);
    CountingMetrics m;
    VerificationPipeline pipeline(PipelineConfig{}, nullptr, audit, nullptr, &m);
    assert(pipeline.bundle().capability() == Capability::Unavailable);

    VerifyOutcome out = pipeline.verify(john_doe(), 1000);
    assert(out.ok);
    assert(out.state == PipelineState::DegradedCompleted);
    const VerificationResult& r = out.result;
    assert(r.id == "VER1000-0");
    assert(r.timestamp == "1970-01-01T00:00:01.000Z");
    assert(near(r.score.fraud_probability, 50.0));
    assert(r.score.risk_level == RiskLevel::Medium);
    assert(near(r.score.confidence, 50.0));
    assert(r.score.status == Status::Verified);
    assert(r.details.document_authenticity == "Valid");
    assert(r.details.address_verification == "Verified");
    assert(r.details.anomaly_score == "50.00");
    assert(r.degraded && r.source == ScoreSource::Default);
    assert(r.record.document_type == DocumentType::Aadhar);

    auto entries = audit.read_all();
    assert(entries.size() == 1);
    assert(entries[0].name == "John Doe" && entries[0].id_type == "AADHAR");
    assert(entries[0].risk_level == RiskLevel::Medium);

    // Same input, same probability; ids stay unique.
    VerifyOutcome again = pipeline.verify(john_doe(), 1000);
    assert(again.ok && again.result.id == "VER1000-1");
    assert(again.result.score.fraud_probability == r.score.fraud_probability);

    IdentityInput bad = john_doe();
    bad.name = "";
    VerifyOutcome rej = pipeline.verify(bad);
    assert(!rej.ok);
    assert(rej.state == PipelineState::Rejected);
    assert(rej.error.kind == ErrorKind::Validation);
    assert(rej.error.message == "name is required");
    assert(audit.read_all().size() == 2);

    assert(m.degraded == 2 && m.rejected == 1 && m.completed == 0);
  }
  ::unlink(path.c_str());

  // Full street address with state and postcode, no models loaded.
  {
    AuditLogConfig acfg{};
    acfg.path = path;
    AuditLog audit(acfg);
    VerificationPipeline pipeline(PipelineConfig{}, nullptr, audit);
    IdentityInput in{};
    in.name = "John Doe";
    in.document_number = "123456789012";
    in.address = "123 Main Street, City, State 12345";
    in.document_type = "AADHAR";

    VerifyOutcome out = pipeline.verify(in, 1792397702117ULL);
    assert(out.ok && out.state == PipelineState::DegradedCompleted);
    const VerificationResult& r = out.result;
    assert(r.record.address == "123 Main Street, City, State 12345");
    assert(near(r.score.fraud_probability, 50.0));
    assert(r.score.risk_level == RiskLevel::Medium);
    assert(near(r.score.confidence, 50.0));
    assert(r.score.status == Status::Verified);
    assert(r.details.document_authenticity == "Valid");
    assert(r.details.address_verification == "Verified");
    assert(r.details.anomaly_score == "50.00");

    auto entries = audit.read_all();
    assert(entries.size() == 1);
    assert(entries[0].name == "John Doe" && entries[0].document_number == "123456789012");
    assert(near(entries[0].fraud_probability, 50.0) && entries[0].risk_level == RiskLevel::Medium);
    assert(near(entries[0].confidence, 50.0));
  }
  ::unlink(path.c_str());

  // A working model completes without degradation.
  {
    ModelArtifacts a{};
    std::vector<double> w(kFeatureCount, 0.0);
    w[static_cast<size_t>(Feature::DocumentWellFormed)] = -3.0;
    a.classifier = std::make_unique<LogisticClassifier>(std::move(w), 0.0);
    auto bundle = ModelBundle::from_artifacts(std::move(a));
    AuditLogConfig acfg{};
    acfg.path = path;
    AuditLog audit(acfg);
    VerificationPipeline pipeline(PipelineConfig{}, bundle, audit);

    VerifyOutcome good = pipeline.verify(john_doe());
    assert(good.ok && good.state == PipelineState::Completed);
    assert(good.result.source == ScoreSource::Model && !good.result.degraded);
    assert(good.result.score.risk_level == RiskLevel::Low);
    assert(good.result.id.compare(0, 3, "VER") == 0);

    IdentityInput malformed = john_doe();
    malformed.document_number = "12AB";
    VerifyOutcome odd = pipeline.verify(malformed);
    assert(odd.ok && odd.result.score.risk_level == RiskLevel::Medium);
  }
  ::unlink(path.c_str());

  // Audit write failure fails the request but keeps the computed result.
  {
    AuditLogConfig acfg{};
    acfg.path = "/nonexistent/kyc/audit.csv";
    AuditLog audit(acfg);
    CountingMetrics m;
    VerificationPipeline pipeline(PipelineConfig{}, nullptr, audit, nullptr, &m);
    VerifyOutcome out = pipeline.verify(john_doe());
    assert(!out.ok);
    assert(out.error.kind == ErrorKind::Persistence);
    assert(out.state == PipelineState::Classified);
    assert(near(out.result.score.fraud_probability, 50.0));
    assert(m.persistence == 1);
  }
}
