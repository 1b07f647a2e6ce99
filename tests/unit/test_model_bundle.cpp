#include "kyc/ModelBundle.h"
#include "test_support.h"
#include <cassert>
#include <stdexcept>

using namespace kyc;
using kyc_test::near;

namespace {

FeatureVector sample() {
  return {8.0, 12.0, 24.0, 4.0, 0.0, 1.0, 2.0, 0.0};
}

std::unique_ptr<IClassifier> logistic(size_t width, double w0 = 0.0, double intercept = 0.0) {
  std::vector<double> w(width, 0.0);
  w[0] = w0;
  return std::make_unique<LogisticClassifier>(std::move(w), intercept);
}

class ThrowingClassifier final : public IClassifier {
 public:
  std::string_view kind() const override { return "throwing"; }
  size_t input_width() const override { return kFeatureCount; }
  bool predict(const FeatureVector&, double&) const override {
    throw std::runtime_error("corrupt weights");
  }
};

class RecordingMetrics final : public IMetricSink {
 public:
  void inc_counter(std::string_view name, uint64_t value, const std::vector<MetricLabel>&) override {
    if (name == "kyc_scoring_degraded_total") degraded += value;
  }
  void set_gauge(std::string_view name, double value, const std::vector<MetricLabel>&) override {
    if (name == "kyc_model_capability") capability = value;
  }
  void observe_histogram(std::string_view, double, const std::vector<MetricLabel>&) override {}

  uint64_t degraded{0};
  double capability{-1.0};
};

} // namespace

void test_model_bundle() {
  // select -> scale -> classify: x[0] = 8 is selected, scaled to 0, sigmoid(0) = 0.5.
  {
    ModelArtifacts a{};
    a.selector = FeatureSelector(kFeatureCount, {0, 3});
    a.scaler = StandardScaler({8.0, 0.0}, {2.0, 1.0});
    a.classifier = logistic(2, 1.0);
    RecordingMetrics m;
    auto b = ModelBundle::from_artifacts(std::move(a), {}, nullptr, &m);
    assert(b->capability() == Capability::Full);
    assert(describe_plan(b->plan()) == "select->scale->classify");
    assert(near(m.capability, 0.0));
    ScoreTrace t = b->trace(sample());
    assert(t.selected && *t.selected == FeatureVector({8.0, 4.0}));
    assert(t.scaled && near((*t.scaled)[0], 0.0) && near((*t.scaled)[1], 4.0));
    assert(near(t.result.probability, 0.5));
    assert(t.result.source == ScoreSource::Model && !t.result.degraded);
  }

  // Scaler width does not chain after the selector: select -> classify.
  {
    ModelArtifacts a{};
    a.selector = FeatureSelector(kFeatureCount, {0, 3});
    a.scaler = StandardScaler(std::vector<double>(5, 0.0), std::vector<double>(5, 1.0));
    a.classifier = logistic(2);
    auto b = ModelBundle::from_artifacts(std::move(a));
    assert(b->capability() == Capability::Partial);
    assert(describe_plan(b->plan()) == "select->classify");
  }

  // No selector: scale -> classify on the raw width.
  {
    ModelArtifacts a{};
    a.scaler = StandardScaler(std::vector<double>(kFeatureCount, 0.0), std::vector<double>(kFeatureCount, 1.0));
    a.classifier = logistic(kFeatureCount);
    auto b = ModelBundle::from_artifacts(std::move(a));
    assert(b->capability() == Capability::Partial);
    assert(describe_plan(b->plan()) == "scale->classify");
  }

  {
    ModelArtifacts a{};
    a.classifier = logistic(kFeatureCount, 0.0, 2.0);
    auto b = ModelBundle::from_artifacts(std::move(a));
    assert(b->capability() == Capability::ClassifierOnly);
    double p1 = b->probability(sample());
    double p2 = b->probability(sample());
    assert(p1 == p2);
    assert(p1 > 0.88 && p1 < 0.89);

    // Wrong width at request time degrades to the safe default.
    ScoreResult r = b->score({1.0, 2.0});
    assert(r.degraded && r.source == ScoreSource::Default && near(r.probability, 0.5));
    assert(!r.degrade_reason.empty());
  }

  // Classifier expects a width nothing produces.
  {
    ModelArtifacts a{};
    a.classifier = logistic(5);
    FallbackTable fb;
    fb.insert("123456789012", 0.8);
    a.fallback = fb;
    RecordingMetrics m;
    ModelBundleConfig cfg{};
    cfg.safe_default_probability = 0.4;
    auto b = ModelBundle::from_artifacts(std::move(a), cfg, nullptr, &m);
    assert(b->capability() == Capability::Unavailable);
    assert(b->plan().empty() && describe_plan(b->plan()) == "none");
    assert(near(m.capability, 3.0));

    ScoreResult known = b->score(sample(), "123456789012");
    assert(known.degraded && known.source == ScoreSource::Fallback && near(known.probability, 0.8));
    ScoreResult unknown = b->score(sample(), "999999999999");
    assert(unknown.degraded && unknown.source == ScoreSource::Default && near(unknown.probability, 0.4));
    assert(m.degraded == 2);
  }

  {
    ModelArtifacts a{};
    a.classifier = std::make_unique<ThrowingClassifier>();
    auto b = ModelBundle::from_artifacts(std::move(a));
    assert(b->capability() == Capability::ClassifierOnly);
    ScoreResult r = b->score(sample());
    assert(r.degraded && r.source == ScoreSource::Default && near(r.probability, 0.5));
    assert(r.degrade_reason.find("corrupt weights") != std::string::npos);
  }

  // Out-of-range safe default is replaced.
  {
    ModelBundleConfig cfg{};
    cfg.safe_default_probability = 1.5;
    auto b = ModelBundle::from_artifacts(ModelArtifacts{}, cfg);
    assert(near(b->score(sample()).probability, 0.5));
  }

  // Loading from files; a missing or broken artifact is left out.
  {
    std::string cls = kyc_test::temp_path("cls");
    std::string sel = kyc_test::temp_path("sel");
    std::string fb = kyc_test::temp_path("fb");
    kyc_test::write_file(cls, "kind logistic\nweights 0 0 0\nintercept 0\n");
    kyc_test::write_file(sel, "kind selector\ninput_width 8\nindices 0 1 2\n");
    kyc_test::write_file(fb, "Document_Number,GNN_Fraud_Probability\nABCDE1234F,0.7\n");
    ModelBundleConfig cfg{};
    cfg.classifier_path = cls;
    cfg.selector_path = sel;
    cfg.scaler_path = "/nonexistent/kyc/scaler.txt";
    cfg.fallback_path = fb;
    auto b = ModelBundle::load(cfg);
    BundleStatus st = b->status();
    assert(st.capability == Capability::Partial);
    assert(st.classifier_loaded && st.selector_loaded && !st.scaler_loaded);
    assert(st.classifier_kind == "logistic");
    assert(st.plan == "select->classify");
    assert(st.fallback_entries == 1);
    assert(near(b->probability(sample()), 0.5));

    kyc_test::write_file(cls, "kind logistic\nweights 1 oops\n");
    auto broken = ModelBundle::load(cfg);
    assert(broken->capability() == Capability::Unavailable);
    assert(!broken->status().classifier_loaded);
    ScoreResult r = broken->score(sample(), "ABCDE1234F");
    assert(r.source == ScoreSource::Fallback && near(r.probability, 0.7));

    ::unlink(cls.c_str());
    ::unlink(sel.c_str());
    ::unlink(fb.c_str());
  }

  {
    auto empty = ModelBundle::load(ModelBundleConfig{});
    assert(empty->capability() == Capability::Unavailable);
  }
}
