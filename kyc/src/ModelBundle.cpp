#include "kyc/ModelBundle.h"
#include <array>
#include <cmath>
#include <exception>

namespace kyc {

namespace {
constexpr std::string_view kComponent = "model_bundle";

// Degradation ladder, most capable first.
const std::array<std::vector<PlanStep>, 4> kLadder = {{
    {PlanStep::Select, PlanStep::Scale, PlanStep::Classify},
    {PlanStep::Select, PlanStep::Classify},
    {PlanStep::Scale, PlanStep::Classify},
    {PlanStep::Classify},
}};

double clamp01(double v) {
  if (v < 0.0) return 0.0;
  if (v > 1.0) return 1.0;
  return v;
}

template <typename T>
void load_optional(const std::string& path, std::string_view what, ILogSink* log,
                   T (*parse)(std::string_view, std::string&), T& out) {
  if (path.empty()) {
    log->log(LogLevel::Info, kComponent, std::string(what) + " not configured");
    return;
  }
  std::string text;
  std::string error;
  if (!read_text_file(path, text, error)) {
    log->log(LogLevel::Error, kComponent, std::string(what) + " load failed: " + error);
    return;
  }
  out = parse(text, error);
  if (!out) {
    log->log(LogLevel::Error, kComponent, std::string(what) + " load failed: " + path + ": " + error);
    return;
  }
  log->log(LogLevel::Info, kComponent, "loaded " + std::string(what) + " from " + path);
}

std::optional<FallbackTable> parse_fallback_default(std::string_view text, std::string& error) {
  return parse_fallback_table(text, error);
}
} // namespace

std::string_view to_string(Capability c) {
  switch (c) {
    case Capability::Full: return "full";
    case Capability::Partial: return "partial";
    case Capability::ClassifierOnly: return "classifier-only";
    case Capability::Unavailable: return "unavailable";
  }
  return "unavailable";
}

std::string describe_plan(const std::vector<PlanStep>& plan) {
  if (plan.empty()) return "none";
  std::string out;
  for (PlanStep s : plan) {
    if (!out.empty()) out += "->";
    switch (s) {
      case PlanStep::Select: out += "select"; break;
      case PlanStep::Scale: out += "scale"; break;
      case PlanStep::Classify: out += "classify"; break;
    }
  }
  return out;
}

std::shared_ptr<const ModelBundle> ModelBundle::load(const ModelBundleConfig& cfg, ILogSink* log,
                                                     IMetricSink* metrics) {
  ILogSink* lg = log ? log : &noop_log();
  ModelArtifacts a{};
  load_optional(cfg.classifier_path, "classifier", lg, &parse_classifier, a.classifier);
  load_optional(cfg.selector_path, "feature selector", lg, &parse_selector, a.selector);
  load_optional(cfg.scaler_path, "scaler", lg, &parse_scaler, a.scaler);
  load_optional(cfg.fallback_path, "fallback table", lg, &parse_fallback_default, a.fallback);
  return from_artifacts(std::move(a), cfg, log, metrics);
}

std::shared_ptr<const ModelBundle> ModelBundle::from_artifacts(ModelArtifacts artifacts,
                                                               const ModelBundleConfig& cfg,
                                                               ILogSink* log, IMetricSink* metrics) {
  return std::make_shared<const ModelBundle>(Key{}, std::move(artifacts), cfg, log, metrics);
}

ModelBundle::ModelBundle(Key, ModelArtifacts artifacts, const ModelBundleConfig& cfg, ILogSink* log,
                         IMetricSink* metrics)
    : artifacts_(std::move(artifacts)),
      safe_default_(cfg.safe_default_probability),
      log_(log ? log : &noop_log()),
      metrics_(metrics ? metrics : &noop_metrics()) {
  if (!(safe_default_ > 0.0 && safe_default_ < 1.0)) {
    log_->log(LogLevel::Warn, kComponent, "safe default probability out of (0,1), using 0.50");
    safe_default_ = 0.5;
  }
  choose_plan();
  metrics_->set_gauge("kyc_model_capability", static_cast<double>(capability_));
}

void ModelBundle::choose_plan() {
  const auto& a = artifacts_;
  for (const auto& candidate : kLadder) {
    size_t width = kFeatureCount;
    bool ok = true;
    for (PlanStep s : candidate) {
      if (s == PlanStep::Select) {
        ok = a.selector && a.selector->input_width() == width;
        if (ok) width = a.selector->output_width();
      } else if (s == PlanStep::Scale) {
        ok = a.scaler && a.scaler->width() == width;
      } else {
        ok = a.classifier && a.classifier->input_width() == width;
      }
      if (!ok) break;
    }
    if (ok) {
      plan_ = candidate;
      break;
    }
  }

  size_t transforms = plan_.empty() ? 0 : plan_.size() - 1;
  if (plan_.empty()) capability_ = Capability::Unavailable;
  else if (transforms == 2) capability_ = Capability::Full;
  else if (transforms == 1) capability_ = Capability::Partial;
  else capability_ = Capability::ClassifierOnly;

  if (a.classifier && plan_.empty()) {
    log_->log(LogLevel::Error, kComponent,
              "classifier expects " + std::to_string(a.classifier->input_width()) +
                  " features and no transform chain produces that width");
  }
  bool uses_select = false;
  bool uses_scale = false;
  for (PlanStep s : plan_) {
    uses_select = uses_select || s == PlanStep::Select;
    uses_scale = uses_scale || s == PlanStep::Scale;
  }
  if (a.selector && !uses_select && !plan_.empty()) {
    log_->log(LogLevel::Warn, kComponent, "feature selector loaded but widths do not chain; skipped");
  }
  if (a.scaler && !uses_scale && !plan_.empty()) {
    log_->log(LogLevel::Warn, kComponent, "scaler loaded but widths do not chain; skipped");
  }
  log_->log(capability_ == Capability::Unavailable ? LogLevel::Warn : LogLevel::Info, kComponent,
            "capability " + std::string(to_string(capability_)) + " plan " + describe_plan(plan_) +
                " fallback entries " + std::to_string(a.fallback ? a.fallback->size() : 0));
}

bool ModelBundle::run_plan(const FeatureVector& x, double& p, ScoreTrace* trace, std::string& why) const {
  const auto& a = artifacts_;
  FeatureVector cur = x;
  FeatureVector next;
  for (PlanStep s : plan_) {
    switch (s) {
      case PlanStep::Select:
        if (!a.selector->apply(cur, next)) {
          why = "feature selection rejected a vector of width " + std::to_string(cur.size());
          return false;
        }
        cur.swap(next);
        if (trace) trace->selected = cur;
        break;
      case PlanStep::Scale:
        if (!a.scaler->apply(cur, next)) {
          why = "scaling rejected a vector of width " + std::to_string(cur.size());
          return false;
        }
        cur.swap(next);
        if (trace) trace->scaled = cur;
        break;
      case PlanStep::Classify:
        if (!a.classifier->predict(cur, p)) {
          why = "classifier rejected a vector of width " + std::to_string(cur.size());
          return false;
        }
        if (!std::isfinite(p)) {
          why = "classifier produced a non-finite probability";
          return false;
        }
        break;
    }
  }
  return true;
}

ScoreResult ModelBundle::resolve_unavailable(std::string_view document_number, std::string reason) const {
  ScoreResult res{};
  res.degraded = true;
  res.degrade_reason = std::move(reason);
  if (artifacts_.fallback && !document_number.empty()) {
    if (auto p = artifacts_.fallback->lookup(document_number)) {
      res.probability = clamp01(*p);
      res.source = ScoreSource::Fallback;
      return res;
    }
  }
  res.probability = safe_default_;
  res.source = ScoreSource::Default;
  return res;
}

ScoreResult ModelBundle::score(const FeatureVector& x, std::string_view document_number) const {
  return trace(x, document_number).result;
}

ScoreTrace ModelBundle::trace(const FeatureVector& x, std::string_view document_number) const {
  ScoreTrace t{};
  t.raw = x;
  if (plan_.empty()) {
    t.result = resolve_unavailable(document_number, "no classifier available");
    metrics_->inc_counter("kyc_scoring_degraded_total", 1, {{"reason", "unavailable"}});
    return t;
  }

  std::string why;
  double p = 0.0;
  bool ok = false;
  try {
    ok = run_plan(x, p, &t, why);
  } catch (const std::exception& e) {
    why = std::string("scoring threw: ") + e.what();
    ok = false;
  }

  if (!ok) {
    log_->log(LogLevel::Warn, kComponent, "degraded scoring: " + why);
    metrics_->inc_counter("kyc_scoring_degraded_total", 1, {{"reason", "model_error"}});
    t.result = resolve_unavailable(document_number, why);
    return t;
  }

  t.result.probability = clamp01(p);
  t.result.source = ScoreSource::Model;
  t.result.degraded = false;
  return t;
}

BundleStatus ModelBundle::status() const {
  BundleStatus s{};
  s.capability = capability_;
  s.classifier_loaded = artifacts_.classifier != nullptr;
  s.selector_loaded = artifacts_.selector.has_value();
  s.scaler_loaded = artifacts_.scaler.has_value();
  s.classifier_kind = artifacts_.classifier ? std::string(artifacts_.classifier->kind()) : std::string();
  s.plan = describe_plan(plan_);
  s.fallback_entries = artifacts_.fallback ? artifacts_.fallback->size() : 0;
  return s;
}

} // namespace kyc
