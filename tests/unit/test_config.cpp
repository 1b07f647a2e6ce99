#include "kyc/Config.h"
#include "test_support.h"
#include <cassert>

using namespace kyc;
using kyc_test::near;

void test_config() {
  {
    KycConfig cfg{};
    ConfigResult r = parse_config(
        "# scoring\n"
        "model.classifier   models/classifier.txt\n"
        "model.fallback models/gnn_pred.csv  # precomputed\n"
        "model.safe_default 0.45\n"
        "\n"
        "risk.low_upper 30\n"
        "risk.high_lower 70\n"
        "audit.path /var/lib/kyc/audit.csv\n"
        "audit.sync yes\n"
        "batch.max_workers 4\n"
        "log.level debug\n",
        cfg);
    assert(r.ok);
    assert(cfg.model.classifier_path == "models/classifier.txt");
    assert(cfg.model.fallback_path == "models/gnn_pred.csv");
    assert(cfg.model.selector_path.empty());
    assert(near(cfg.model.safe_default_probability, 0.45));
    assert(near(cfg.pipeline.risk.low_upper, 30.0) && near(cfg.pipeline.risk.high_lower, 70.0));
    assert(cfg.audit.path == "/var/lib/kyc/audit.csv" && cfg.audit.sync_on_append);
    assert(cfg.batch.max_workers == 4 && cfg.batch.max_rows == 10000);
    assert(cfg.log.level == LogLevel::Debug);
  }

  {
    KycConfig cfg{};
    ConfigResult r = parse_config("batch.max_workers 2\nmodel.colour red\n", cfg, "kyc.conf");
    assert(!r.ok);
    assert(r.error.find("kyc.conf:2") == 0);
    assert(r.error.find("unknown key") != std::string::npos);
    // Nothing applied on failure.
    assert(cfg.batch.max_workers == 1);
  }

  KycConfig cfg{};
  assert(!parse_config("batch.max_workers 0\n", cfg).ok);
  assert(!parse_config("model.safe_default 1.0\n", cfg).ok);
  assert(!parse_config("log.level loud\n", cfg).ok);
  assert(!parse_config("audit.path\n", cfg).ok);
  assert(!parse_config("risk.low_upper 80\n", cfg).ok);

  std::string path = kyc_test::temp_path("config");
  kyc_test::write_file(path, "audit.path from_file.csv\n");
  assert(load_config(path, cfg).ok);
  assert(cfg.audit.path == "from_file.csv");
  ::unlink(path.c_str());
  assert(!load_config("/nonexistent/kyc.conf", cfg).ok);
}
