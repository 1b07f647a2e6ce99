#include "kyc/AuditLog.h"
#include "kyc/Util.h"
#include "test_support.h"
#include <cassert>
#include <thread>
#include <vector>

using namespace kyc;
using kyc_test::near;

namespace {

AuditEntry entry(const std::string& ts, const std::string& name, double p, RiskLevel level) {
  AuditEntry e{};
  e.timestamp = ts;
  e.name = name;
  e.document_number = "123456789012";
  e.id_type = "AADHAR";
  e.fraud_probability = p;
  e.risk_level = level;
  e.confidence = 100.0 - p;
  return e;
}

} // namespace

void test_audit_log() {
  {
    AuditEntry e = entry("2026-10-19T08:15:02.117Z", "Doe, John", 71.25, RiskLevel::High);
    std::string line = encode_audit_line(e);
    assert(line == "2026-10-19T08:15:02.117Z,\"Doe, John\",123456789012,AADHAR,71.25,High,28.75");
    AuditEntry back{};
    assert(decode_audit_line(line, back));
    assert(back.name == "Doe, John" && back.risk_level == RiskLevel::High);
    assert(near(back.fraud_probability, 71.25) && near(back.confidence, 28.75));
    assert(!decode_audit_line(kAuditHeader, back));
    assert(!decode_audit_line("2026-10-19T08:15:02.117Z,John,1,PASSPORT,10.00,Low,90.00", back));
    assert(!decode_audit_line("not a timestamp,John,1,PAN,10.00,Low,90.00", back));
    assert(!decode_audit_line("2026-10-19T08:15:02.117Z,John,1,PAN,110.00,High,0.00", back));
  }

  std::string path = kyc_test::temp_path("audit");
  {
    AuditLogConfig cfg{};
    cfg.path = path;
    cfg.sync_on_append = true;
    AuditLog log(cfg);
    assert(log.append(entry("2026-10-19T08:00:00.000Z", "First", 10.0, RiskLevel::Low)).ok);
    assert(log.append(entry("2026-10-19T09:00:00.000Z", "Second", 50.0, RiskLevel::Medium)).ok);
    assert(log.append(entry("2026-10-19T07:00:00.000Z", "Third", 90.0, RiskLevel::High)).ok);

    std::string text = kyc_test::read_file(path);
    assert(text.compare(0, std::string(kAuditHeader).size(), kAuditHeader) == 0);

    ReadStats st{};
    auto all = log.read_all(&st);
    assert(st.ok && st.skipped == 0 && st.entries == 3);
    assert(all.size() == 3);
    assert(all[0].name == "Second" && all[1].name == "First" && all[2].name == "Third");

    auto history = log.history();
    assert(history.size() == 3);
    assert(history[2].score.status == Status::Flagged);
    assert(history[0].score.status == Status::Verified);
    assert(history[0].id == "VER" + std::to_string(*parse_iso8601("2026-10-19T09:00:00.000Z")));
    assert(history[0].details.anomaly_score == "50.00");
    HistoryStats hs = summarize(history);
    assert(hs.total == 3 && hs.flagged == 1 && hs.verified == 2);
    assert(hs.low == 1 && hs.medium == 1 && hs.high == 1);
  }

  // Torn trailing write and junk lines are skipped, the rest survives.
  {
    kyc_test::write_file(path, std::string(kAuditHeader) + "\n" +
                                   "2026-10-19T08:00:00.000Z,Kept,123456789012,PAN,20.00,Low,80.00\n" +
                                   "garbage line\n" +
                                   "2026-10-19T08:00:01.000Z,Torn,1234");
    AuditLogConfig cfg{};
    cfg.path = path;
    AuditLog log(cfg);
    ReadStats st{};
    auto all = log.read_all(&st);
    assert(all.size() == 1 && all[0].name == "Kept");
    assert(st.skipped == 2);
  }

  // An append after a torn write starts on a fresh line and reads back.
  {
    kyc_test::write_file(path, std::string(kAuditHeader) + "\n" +
                                   "2026-10-19T08:00:00.000Z,Kept,123456789012,PAN,20.00,Low,80.00\n" +
                                   "2026-10-19T08:00:01.000Z,Torn,1234");
    AuditLogConfig cfg{};
    cfg.path = path;
    AuditLog log(cfg);
    AppendResult r = log.append(entry("2026-10-19T08:00:02.000Z", "AfterCrash", 35.0, RiskLevel::Medium));
    assert(r.ok);
    ReadStats st{};
    auto all = log.read_all(&st);
    assert(all.size() == 2);
    assert(all[0].name == "AfterCrash" && all[1].name == "Kept");
    assert(st.skipped == 1);
    std::string text = kyc_test::read_file(path);
    assert(text.find("Torn,1234\n2026-10-19T08:00:02.000Z,AfterCrash,") != std::string::npos);
    assert(text.back() == '\n');
  }

  // Older files written with a "Fraud_Risk" column and no confidence.
  {
    auto rows = parse_audit_text(
        "Timestamp,Name,Document_Number,ID_Type,Fraud_Probability,Fraud_Risk\n"
        "2025-01-02T03:04:05,Legacy,ABCDE1234F,PAN,40.50,Medium\n");
    assert(rows.size() == 1);
    assert(rows[0].risk_level == RiskLevel::Medium);
    assert(near(rows[0].confidence, 59.5));
  }

  // Concurrent appends never interleave.
  {
    ::unlink(path.c_str());
    AuditLogConfig cfg{};
    cfg.path = path;
    AuditLog log(cfg);
    assert(log.read_all().empty());
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
      threads.emplace_back([&log, t]() {
        for (int i = 0; i < 50; ++i) {
          std::string name = "Writer " + std::to_string(t) + " entry " + std::to_string(i);
          AppendResult r = log.append(entry(format_iso8601(1700000000000ULL + static_cast<TimeMs>(t * 100 + i)),
                                            name, 12.5, RiskLevel::Low));
          assert(r.ok);
        }
      });
    }
    for (auto& th : threads) th.join();
    ReadStats st{};
    auto all = log.read_all(&st);
    assert(all.size() == 200);
    assert(st.skipped == 0);
    std::string text = kyc_test::read_file(path);
    size_t headers = 0;
    for (size_t pos = text.find("Timestamp,"); pos != std::string::npos; pos = text.find("Timestamp,", pos + 1)) {
      ++headers;
    }
    assert(headers == 1);
  }
  ::unlink(path.c_str());

  {
    AuditLogConfig cfg{};
    cfg.path = "/nonexistent/kyc/audit.csv";
    AuditLog log(cfg);
    AppendResult r = log.append(entry("2026-10-19T08:00:00.000Z", "Nobody", 10.0, RiskLevel::Low));
    assert(!r.ok && !r.error.empty());
    assert(log.read_all().empty());
  }
}
