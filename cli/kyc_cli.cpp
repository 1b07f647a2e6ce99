#include "kyc/Artifacts.h"
#include "kyc/AuditLog.h"
#include "kyc/Batch.h"
#include "kyc/Config.h"
#include "kyc/Log.h"
#include "kyc/ModelBundle.h"
#include "kyc/Pipeline.h"
#include "kyc/Util.h"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

using namespace kyc;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

int usage() {
  std::cerr << "usage: kyc_cli [--config FILE] verify NAME DOCUMENT_NUMBER DOCUMENT_TYPE [ADDRESS]\n"
               "       kyc_cli [--config FILE] batch FILE.csv\n"
               "       kyc_cli [--config FILE] history [LIMIT]\n"
               "       kyc_cli [--config FILE] status\n"
               "       kyc_cli [--config FILE] trace NAME DOCUMENT_NUMBER DOCUMENT_TYPE [ADDRESS]\n";
  return kExitUsage;
}

std::string join_vector(const FeatureVector& v) {
  std::string out;
  for (double d : v) {
    if (!out.empty()) out += ' ';
    out += format_fixed2(d);
  }
  return out;
}

IdentityInput input_from_args(const std::vector<std::string>& args) {
  IdentityInput in{};
  in.name = args[1];
  in.document_number = args[2];
  in.document_type = args[3];
  if (args.size() > 4) in.address = args[4];
  return in;
}

void print_result(const VerificationResult& r, const std::string& prefix = {}) {
  std::cout << prefix << "id=" << r.id << "\n"
            << prefix << "timestamp=" << r.timestamp << "\n"
            << prefix << "name=" << r.record.name << "\n"
            << prefix << "document_type=" << to_string(r.record.document_type) << "\n"
            << prefix << "fraud_probability=" << format_fixed2(r.score.fraud_probability) << "\n"
            << prefix << "risk_level=" << to_string(r.score.risk_level) << "\n"
            << prefix << "confidence=" << format_fixed2(r.score.confidence) << "\n"
            << prefix << "status=" << to_string(r.score.status) << "\n"
            << prefix << "document_authenticity=" << r.details.document_authenticity << "\n"
            << prefix << "address_verification=" << r.details.address_verification << "\n"
            << prefix << "anomaly_score=" << r.details.anomaly_score << "\n"
            << prefix << "source=" << to_string(r.source) << "\n"
            << prefix << "degraded=" << (r.degraded ? "true" : "false") << "\n";
}

int cmd_verify(VerificationPipeline& pipeline, const std::vector<std::string>& args) {
  if (args.size() < 4 || args.size() > 5) return usage();
  VerifyOutcome out = pipeline.verify(input_from_args(args));
  std::cout << "state=" << to_string(out.state) << "\n";
  if (out.state != PipelineState::Rejected && out.state != PipelineState::Received) print_result(out.result);
  if (!out.ok) {
    std::cout << "error=" << to_string(out.error.kind) << "\n"
              << "message=" << out.error.message << "\n";
    return kExitFailed;
  }
  return kExitOk;
}

int cmd_batch(const KycConfig& cfg, VerificationPipeline& pipeline, ILogSink* log,
              const std::vector<std::string>& args) {
  if (args.size() != 2) return usage();
  std::string text;
  std::string error;
  if (!read_text_file(args[1], text, error)) {
    std::cerr << error << "\n";
    return kExitFailed;
  }
  BatchRunner runner(cfg.batch, pipeline, log);
  BatchResult res = runner.run_csv(text);
  if (!res.ok) {
    std::cout << "error=" << to_string(res.error.kind) << "\n"
              << "message=" << res.error.message << "\n";
    return kExitFailed;
  }
  const BatchSummary& s = res.summary;
  std::cout << "total=" << s.total << "\n"
            << "successful=" << s.successful << "\n"
            << "failed=" << s.failed << "\n";
  for (const auto& row : s.results) {
    std::string prefix = "row." + std::to_string(row.row) + ".";
    std::cout << prefix << "ok=" << (row.ok ? "true" : "false") << "\n";
    if (row.ok) {
      std::cout << prefix << "id=" << row.result.id << "\n"
                << prefix << "fraud_probability=" << format_fixed2(row.result.score.fraud_probability) << "\n"
                << prefix << "risk_level=" << to_string(row.result.score.risk_level) << "\n"
                << prefix << "status=" << to_string(row.result.score.status) << "\n";
    } else {
      std::cout << prefix << "error=" << to_string(row.error.kind) << "\n"
                << prefix << "message=" << row.error.message << "\n";
    }
  }
  return kExitOk;
}

int cmd_history(const AuditLog& audit, const std::vector<std::string>& args) {
  if (args.size() > 2) return usage();
  size_t limit = 0;
  if (args.size() == 2 && !parse_size(args[1], limit)) return usage();

  ReadStats st{};
  auto history = audit.history(&st);
  if (!st.ok) {
    std::cerr << st.error << "\n";
    return kExitFailed;
  }
  HistoryStats hs = summarize(history);
  std::cout << "total=" << hs.total << "\n"
            << "verified=" << hs.verified << "\n"
            << "flagged=" << hs.flagged << "\n"
            << "low=" << hs.low << "\n"
            << "medium=" << hs.medium << "\n"
            << "high=" << hs.high << "\n"
            << "skipped_lines=" << st.skipped << "\n";
  size_t n = limit == 0 ? history.size() : std::min(limit, history.size());
  for (size_t i = 0; i < n; ++i) {
    print_result(history[i], "entry." + std::to_string(i + 1) + ".");
  }
  return kExitOk;
}

int cmd_status(const ModelBundle& bundle) {
  BundleStatus s = bundle.status();
  std::cout << "capability=" << to_string(s.capability) << "\n"
            << "plan=" << s.plan << "\n"
            << "classifier=" << (s.classifier_loaded ? s.classifier_kind : "absent") << "\n"
            << "selector=" << (s.selector_loaded ? "loaded" : "absent") << "\n"
            << "scaler=" << (s.scaler_loaded ? "loaded" : "absent") << "\n"
            << "fallback_entries=" << s.fallback_entries << "\n";
  return kExitOk;
}

// Scores without writing to the audit log.
int cmd_trace(const KycConfig& cfg, const VerificationPipeline& pipeline, const std::vector<std::string>& args) {
  if (args.size() < 4 || args.size() > 5) return usage();
  ValidationResult v = validate_identity(input_from_args(args), cfg.pipeline.validation);
  if (!v.ok) {
    std::cout << "error=" << to_string(v.error.kind) << "\n"
              << "message=" << v.error.message << "\n";
    return kExitFailed;
  }
  FeatureVector x = pipeline.extractor().extract(v.record);
  ScoreTrace t = pipeline.bundle().trace(x, v.record.document_number);
  RiskScore score = pipeline.classifier().classify(t.result.probability);
  std::cout << "plan=" << describe_plan(pipeline.bundle().plan()) << "\n"
            << "features=" << join_vector(t.raw) << "\n";
  if (t.selected) std::cout << "selected=" << join_vector(*t.selected) << "\n";
  if (t.scaled) std::cout << "scaled=" << join_vector(*t.scaled) << "\n";
  std::cout << "probability=" << t.result.probability << "\n"
            << "source=" << to_string(t.result.source) << "\n"
            << "degraded=" << (t.result.degraded ? "true" : "false") << "\n";
  if (t.result.degraded) std::cout << "degrade_reason=" << t.result.degrade_reason << "\n";
  std::cout << "fraud_probability=" << format_fixed2(score.fraud_probability) << "\n"
            << "risk_level=" << to_string(score.risk_level) << "\n";
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  KycConfig cfg{};
  if (args.size() >= 2 && args[0] == "--config") {
    ConfigResult cr = load_config(args[1], cfg);
    if (!cr.ok) {
      std::cerr << cr.error << "\n";
      return kExitUsage;
    }
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) return usage();

  StreamLogSink log(stderr, cfg.log.level);
  auto bundle = ModelBundle::load(cfg.model, &log);
  AuditLog audit(cfg.audit, &log);
  VerificationPipeline pipeline(cfg.pipeline, bundle, audit, &log);

  const std::string& cmd = args[0];
  if (cmd == "verify") return cmd_verify(pipeline, args);
  if (cmd == "batch") return cmd_batch(cfg, pipeline, &log, args);
  if (cmd == "history") return cmd_history(audit, args);
  if (cmd == "status") return cmd_status(*bundle);
  if (cmd == "trace") return cmd_trace(cfg, pipeline, args);
  return usage();
}
