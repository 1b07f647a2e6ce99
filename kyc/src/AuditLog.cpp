#include "kyc/AuditLog.h"
#include "kyc/Artifacts.h"
#include "kyc/Csv.h"
#include "kyc/Util.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace kyc {

const char* const kAuditHeader =
    "Timestamp,Name,Document_Number,ID_Type,Fraud_Probability,Fraud_Risk_Level,Confidence";

namespace {
constexpr std::string_view kComponent = "audit_log";

struct Columns {
  int timestamp{0};
  int name{1};
  int document_number{2};
  int id_type{3};
  int probability{4};
  int level{5};
  int confidence{6}; // -1: absent, recomputed as 100 - probability
};

bool is_header(const std::vector<std::string>& fields) {
  return !fields.empty() && trim(fields[0]) == "Timestamp";
}

bool columns_from_header(const std::vector<std::string>& fields, Columns& out) {
  Columns c{-1, -1, -1, -1, -1, -1, -1};
  for (size_t i = 0; i < fields.size(); ++i) {
    std::string_view h = trim(fields[i]);
    int idx = static_cast<int>(i);
    if (h == "Timestamp") c.timestamp = idx;
    else if (h == "Name") c.name = idx;
    else if (h == "Document_Number") c.document_number = idx;
    else if (h == "ID_Type") c.id_type = idx;
    else if (h == "Fraud_Probability") c.probability = idx;
    else if (h == "Fraud_Risk_Level" || (h == "Fraud_Risk" && c.level < 0)) c.level = idx;
    else if (h == "Confidence") c.confidence = idx;
  }
  if (c.timestamp < 0 || c.name < 0 || c.document_number < 0 || c.id_type < 0 ||
      c.probability < 0 || c.level < 0) {
    return false;
  }
  out = c;
  return true;
}

bool decode_fields(const std::vector<std::string>& f, const Columns& c, AuditEntry& out, TimeMs& ts_ms) {
  int need = std::max({c.timestamp, c.name, c.document_number, c.id_type, c.probability, c.level, c.confidence});
  if (static_cast<int>(f.size()) <= need) return false;

  auto ts = parse_iso8601(f[static_cast<size_t>(c.timestamp)]);
  if (!ts) return false;
  auto type = parse_document_type(f[static_cast<size_t>(c.id_type)]);
  if (!type) return false;
  auto level = parse_risk_level(f[static_cast<size_t>(c.level)]);
  if (!level) return false;
  double p = 0.0;
  if (!parse_double(f[static_cast<size_t>(c.probability)], p) || p < 0.0 || p > 100.0) return false;
  double conf = 100.0 - p;
  if (c.confidence >= 0) {
    if (!parse_double(f[static_cast<size_t>(c.confidence)], conf) || conf < 0.0 || conf > 100.0) return false;
  }
  std::string_view name = trim(f[static_cast<size_t>(c.name)]);
  std::string_view doc = trim(f[static_cast<size_t>(c.document_number)]);
  if (name.empty() || doc.empty()) return false;

  out.timestamp = std::string(trim(f[static_cast<size_t>(c.timestamp)]));
  out.name = std::string(name);
  out.document_number = std::string(doc);
  out.id_type = std::string(to_string(*type));
  out.fraud_probability = p;
  out.risk_level = *level;
  out.confidence = conf;
  ts_ms = *ts;
  return true;
}

bool write_all(int fd, const char* data, size_t len, std::string& error) {
  size_t off = 0;
  while (off < len) {
    ssize_t n = ::write(fd, data + off, len - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      error = std::strerror(errno);
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}
} // namespace

std::string encode_audit_line(const AuditEntry& e) {
  std::vector<std::string> fields = {
      e.timestamp,
      e.name,
      e.document_number,
      e.id_type,
      format_fixed2(e.fraud_probability),
      std::string(to_string(e.risk_level)),
      format_fixed2(e.confidence),
  };
  return csv_join(fields);
}

bool decode_audit_line(std::string_view line, AuditEntry& out) {
  std::vector<std::string> fields;
  if (csv_split_line(line, fields) != CsvError::None) return false;
  if (is_header(fields)) return false;
  TimeMs ms = 0;
  return decode_fields(fields, Columns{}, out, ms);
}

std::vector<AuditEntry> parse_audit_text(std::string_view text, ReadStats* stats) {
  ReadStats local{};
  ReadStats& st = stats ? *stats : local;
  std::vector<std::pair<TimeMs, AuditEntry>> rows;
  Columns cols{};
  std::vector<std::string> fields;

  size_t pos = 0;
  while (pos < text.size()) {
    size_t end = text.find('\n', pos);
    bool terminated = end != std::string_view::npos;
    if (!terminated) end = text.size();
    std::string_view line = text.substr(pos, end - pos);
    pos = end + 1;
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (trim(line).empty()) continue;
    ++st.lines;

    // Appends always end with '\n'; anything else is a torn write.
    if (!terminated) {
      ++st.skipped;
      continue;
    }
    if (csv_split_line(line, fields) != CsvError::None) {
      ++st.skipped;
      continue;
    }
    if (is_header(fields)) {
      Columns c{};
      if (columns_from_header(fields, c)) cols = c;
      else ++st.skipped;
      continue;
    }
    AuditEntry e{};
    TimeMs ms = 0;
    if (!decode_fields(fields, cols, e, ms)) {
      ++st.skipped;
      continue;
    }
    rows.emplace_back(ms, std::move(e));
  }

  std::stable_sort(rows.begin(), rows.end(),
                   [](const auto& a, const auto& b) { return a.first > b.first; });
  std::vector<AuditEntry> out;
  out.reserve(rows.size());
  for (auto& r : rows) out.push_back(std::move(r.second));
  st.entries = out.size();
  return out;
}

AuditEntry to_audit_entry(const VerificationResult& r) {
  AuditEntry e{};
  e.timestamp = r.timestamp;
  e.name = r.record.name;
  e.document_number = r.record.document_number;
  e.id_type = std::string(to_string(r.record.document_type));
  e.fraud_probability = r.score.fraud_probability;
  e.risk_level = r.score.risk_level;
  e.confidence = r.score.confidence;
  return e;
}

VerificationResult from_audit_entry(const AuditEntry& e, const RiskClassifier& classifier) {
  VerificationResult r{};
  auto ms = parse_iso8601(e.timestamp);
  r.id = "VER" + std::to_string(ms ? *ms : 0);
  r.timestamp = e.timestamp;
  r.record.name = e.name;
  r.record.document_number = e.document_number;
  r.record.document_type = parse_document_type(e.id_type).value_or(DocumentType::Aadhar);
  r.score.fraud_probability = e.fraud_probability;
  r.score.risk_level = e.risk_level;
  r.score.status = status_for(e.risk_level);
  r.score.confidence = e.confidence;
  r.details = classifier.details(r.score, {});
  // The address is not logged; history shows it as checked at submission.
  r.details.address_verification = "Verified";
  r.source = ScoreSource::Model;
  return r;
}

HistoryStats summarize(const std::vector<VerificationResult>& history) {
  HistoryStats s{};
  for (const auto& r : history) {
    ++s.total;
    if (r.score.status == Status::Flagged) ++s.flagged;
    else ++s.verified;
    switch (r.score.risk_level) {
      case RiskLevel::Low: ++s.low; break;
      case RiskLevel::Medium: ++s.medium; break;
      case RiskLevel::High: ++s.high; break;
    }
  }
  return s;
}

AuditLog::AuditLog(const AuditLogConfig& cfg, ILogSink* log, IMetricSink* metrics)
    : cfg_(cfg), log_(log ? log : &noop_log()), metrics_(metrics ? metrics : &noop_metrics()) {}

AuditLog::~AuditLog() { close_fd(); }

void AuditLog::close_fd() {
  if (fd_ >= 0) ::close(fd_);
  fd_ = -1;
}

bool AuditLog::ensure_open(std::string& error) {
  if (fd_ >= 0) return true;
  int fd = ::open(cfg_.path.c_str(), O_RDWR | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    error = "open " + cfg_.path + ": " + std::strerror(errno);
    return false;
  }
  fd_ = fd;
  return true;
}

AppendResult AuditLog::append(const AuditEntry& entry) {
  AppendResult res{};
  std::string line = encode_audit_line(entry);
  line.push_back('\n');

  std::lock_guard<std::mutex> lock(mu_);
  std::string error;
  if (!ensure_open(error)) {
    res.error = error;
    metrics_->inc_counter("kyc_audit_append_fail_total", 1, {{"reason", "open"}});
    log_->log(LogLevel::Error, kComponent, error);
    return res;
  }

  struct stat st{};
  if (::fstat(fd_, &st) != 0) {
    res.error = std::string("fstat: ") + std::strerror(errno);
    close_fd();
    metrics_->inc_counter("kyc_audit_append_fail_total", 1, {{"reason", "stat"}});
    log_->log(LogLevel::Error, kComponent, res.error);
    return res;
  }
  if (st.st_size == 0) {
    line = std::string(kAuditHeader) + "\n" + line;
  } else {
    // A torn previous write leaves a partial last line; terminate it so this
    // entry starts on its own line.
    char last = '\n';
    ssize_t n = ::pread(fd_, &last, 1, st.st_size - 1);
    if (n != 1) {
      res.error = "pread " + cfg_.path + ": " + (n < 0 ? std::strerror(errno) : "short read");
      close_fd();
      metrics_->inc_counter("kyc_audit_append_fail_total", 1, {{"reason", "read"}});
      log_->log(LogLevel::Error, kComponent, res.error);
      return res;
    }
    if (last != '\n') {
      line.insert(line.begin(), '\n');
      log_->log(LogLevel::Warn, kComponent, "terminated partial last line in " + cfg_.path);
    }
  }

  if (!write_all(fd_, line.data(), line.size(), error)) {
    res.error = "write " + cfg_.path + ": " + error;
    close_fd();
    metrics_->inc_counter("kyc_audit_append_fail_total", 1, {{"reason", "write"}});
    log_->log(LogLevel::Error, kComponent, res.error);
    return res;
  }
  if (cfg_.sync_on_append && ::fsync(fd_) != 0) {
    res.error = "fsync " + cfg_.path + ": " + std::strerror(errno);
    close_fd();
    metrics_->inc_counter("kyc_audit_append_fail_total", 1, {{"reason", "sync"}});
    log_->log(LogLevel::Error, kComponent, res.error);
    return res;
  }
  res.ok = true;
  return res;
}

std::vector<AuditEntry> AuditLog::read_all(ReadStats* stats) const {
  ReadStats local{};
  ReadStats& st = stats ? *stats : local;
  st = ReadStats{};

  std::string text;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (::access(cfg_.path.c_str(), F_OK) != 0) return {};
    std::string error;
    if (!read_text_file(cfg_.path, text, error)) {
      st.ok = false;
      st.error = error;
      log_->log(LogLevel::Error, kComponent, error);
      return {};
    }
  }

  auto entries = parse_audit_text(text, &st);
  if (st.skipped > 0) {
    log_->log(LogLevel::Warn, kComponent,
              "skipped " + std::to_string(st.skipped) + " malformed line(s) in " + cfg_.path);
  }
  return entries;
}

std::vector<VerificationResult> AuditLog::history(ReadStats* stats) const {
  auto entries = read_all(stats);
  std::vector<VerificationResult> out;
  out.reserve(entries.size());
  RiskClassifier classifier{};
  for (const auto& e : entries) out.push_back(from_audit_entry(e, classifier));
  return out;
}

} // namespace kyc
