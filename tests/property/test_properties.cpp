#include "kyc/AuditLog.h"
#include "kyc/Batch.h"
#include "kyc/ModelBundle.h"
#include "kyc/Pipeline.h"
#include "kyc/RiskClassifier.h"
#include "kyc/Util.h"
#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace kyc;

namespace {

// Deterministic so a failure reproduces.
struct Lcg {
  uint64_t s{0x9E3779B97F4A7C15ULL};
  uint32_t next() {
    s = s * 6364136223846793005ULL + 1442695040888963407ULL;
    return static_cast<uint32_t>(s >> 33);
  }
  double unit() { return static_cast<double>(next()) / 2147483648.0; }
};

std::string random_text(Lcg& rng, size_t max_len, const char* alphabet) {
  size_t n = rng.next() % (max_len + 1);
  size_t k = std::char_traits<char>::length(alphabet);
  std::string out;
  for (size_t i = 0; i < n; ++i) out.push_back(alphabet[rng.next() % k]);
  return out;
}

IdentityInput random_input(Lcg& rng) {
  static const char* kTypes[] = {"AADHAR", "PAN", "UTILITY", "pan", " aadhar "};
  IdentityInput in{};
  in.name = "N" + random_text(rng, 24, "abcdefghijklmnopqrstuvwxyz ABCDEFGHIJ0123456789");
  in.document_number = random_text(rng, 14, "0123456789ABCDEFGHIJ-");
  in.address = random_text(rng, 40, "abcdefghijklmnop ,0123456789\"");
  in.document_type = kTypes[rng.next() % 5];
  if (in.document_number.empty()) in.document_number = "1";
  return in;
}

std::string temp_path() {
  std::string tmpl = "/tmp/kyc_props_XXXXXX";
  int fd = ::mkstemp(&tmpl[0]);
  if (fd >= 0) ::close(fd);
  return tmpl;
}

} // namespace

int main() {
  Lcg rng;
  RiskClassifier rc;

  // Tier always defined, confidence complements the probability, boundaries are Medium.
  for (int i = 0; i < 20000; ++i) {
    double prob = rng.unit() * 1.2 - 0.1;
    RiskScore s = rc.classify(prob);
    assert(s.fraud_probability >= 0.0 && s.fraud_probability <= 100.0);
    assert(s.risk_level == RiskLevel::Low || s.risk_level == RiskLevel::Medium || s.risk_level == RiskLevel::High);
    double sum = s.confidence + s.fraud_probability;
    assert(sum > 100.0 - 1e-9 && sum < 100.0 + 1e-9);
    assert((s.status == Status::Flagged) == (s.risk_level == RiskLevel::High));
  }
  assert(rc.classify_percent(33.00).risk_level == RiskLevel::Medium);
  assert(rc.classify_percent(67.00).risk_level == RiskLevel::Medium);

  ModelArtifacts a{};
  a.selector = FeatureSelector(kFeatureCount, {0, 1, 2, 3, 5});
  a.scaler = StandardScaler({10, 10, 20, 3, 0.5}, {5, 3, 10, 2, 0.5});
  a.classifier = std::make_unique<LogisticClassifier>(std::vector<double>{0.3, -0.2, 0.1, 0.4, -1.0}, -0.3);
  auto full = ModelBundle::from_artifacts(std::move(a));
  assert(full->capability() == Capability::Full);
  auto empty = ModelBundle::from_artifacts(ModelArtifacts{});

  std::string path = temp_path();
  AuditLogConfig acfg{};
  acfg.path = path;
  AuditLog audit(acfg);
  VerificationPipeline model_pipeline(PipelineConfig{}, full, audit);
  VerificationPipeline bare_pipeline(PipelineConfig{}, empty, audit);

  size_t logged = 0;
  for (int i = 0; i < 300; ++i) {
    IdentityInput in = random_input(rng);

    // Idempotent scoring.
    VerifyOutcome a1 = model_pipeline.verify(in, 1700000000000ULL + static_cast<TimeMs>(i));
    VerifyOutcome a2 = model_pipeline.verify(in, 1700000000000ULL + static_cast<TimeMs>(i));
    assert(a1.ok && a2.ok);
    assert(a1.result.score.fraud_probability == a2.result.score.fraud_probability);
    assert(a1.result.score.risk_level == a2.result.score.risk_level);
    assert(a1.result.id != a2.result.id);

    // No model: still completes and is logged.
    VerifyOutcome b = bare_pipeline.verify(in, 1700000000000ULL + static_cast<TimeMs>(i));
    assert(b.ok && b.state == PipelineState::DegradedCompleted);
    assert(b.result.score.risk_level == RiskLevel::Medium);
    logged += 3;
  }

  // Round trip through the log keeps tier and probability; status follows the tier.
  ReadStats st{};
  auto history = audit.history(&st);
  assert(st.skipped == 0);
  assert(history.size() == logged);
  for (const auto& r : history) {
    assert((r.score.status == Status::Flagged) == (r.score.risk_level == RiskLevel::High));
    assert(rc.classify_percent(r.score.fraud_probability).risk_level == r.score.risk_level);
  }
  ::unlink(path.c_str());

  // Batch isolation: a bad row 3 never changes the others.
  for (int round = 0; round < 20; ++round) {
    std::string csv = "Full Name,Document Number,Address,Document Type\n";
    for (int r = 1; r <= 6; ++r) {
      IdentityInput in = random_input(rng);
      if (r == 3) in.name.clear();
      csv += csv_join({in.name, in.document_number, in.address, std::string(trim(in.document_type))}) + "\n";
    }
    std::string bpath = temp_path();
    AuditLogConfig bcfg{};
    bcfg.path = bpath;
    AuditLog blog(bcfg);
    VerificationPipeline p(PipelineConfig{}, full, blog);
    BatchConfig cfg{};
    cfg.max_workers = 1 + static_cast<size_t>(round % 4);
    BatchRunner runner(cfg, p);
    BatchResult res = runner.run_csv(csv);
    assert(res.ok);
    assert(res.summary.total == 6 && res.summary.failed == 1 && res.summary.successful == 5);
    assert(!res.summary.results[2].ok && res.summary.results[2].row == 3);
    assert(blog.read_all().size() == 5);
    ::unlink(bpath.c_str());
  }

  std::cout << "kyc_properties ok\n";
  return 0;
}
