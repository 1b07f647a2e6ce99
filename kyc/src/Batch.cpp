#include "kyc/Batch.h"
#include "kyc/Util.h"
#include <atomic>
#include <exception>
#include <system_error>
#include <thread>

namespace kyc {

namespace {
constexpr std::string_view kComponent = "batch";

std::string normalize_header(std::string_view h) {
  std::string out;
  for (char c : to_lower(trim(h))) {
    if (c == ' ' || c == '_' || c == '-' || c == '\t') continue;
    out.push_back(c);
  }
  return out;
}

enum class Column : uint8_t { Name, DocumentNumber, Address, DocumentType, Other };

Column classify_header(std::string_view h) {
  std::string n = normalize_header(h);
  if (n == "fullname" || n == "name") return Column::Name;
  if (n == "documentnumber" || n == "docnumber" || n == "documentno") return Column::DocumentNumber;
  if (n == "address") return Column::Address;
  if (n == "documenttype" || n == "doctype" || n == "idtype") return Column::DocumentType;
  return Column::Other;
}

BatchParse malformed(std::string message) {
  BatchParse p{};
  p.ok = false;
  p.error = Error{ErrorKind::MalformedBatch, std::move(message)};
  return p;
}
} // namespace

BatchParse parse_batch_csv(std::string_view text, const BatchConfig& cfg) {
  CsvReader reader(text, cfg.csv);
  CsvRecord rec;

  bool have_header = false;
  size_t header_fields = 0;
  int name_col = -1, doc_col = -1, addr_col = -1, type_col = -1;
  BatchParse out{};

  for (;;) {
    if (!reader.next(rec)) {
      CsvError err = reader.error();
      if (!have_header || (err != CsvError::TooManyFields && err != CsvError::RecordTooLarge)) break;
      // Oversized data rows are rejected on their own.
      if (out.rows.size() >= cfg.max_rows) {
        return malformed("batch exceeds " + std::to_string(cfg.max_rows) + " rows");
      }
      BatchRow row{};
      row.row = out.rows.size() + 1;
      row.well_formed = false;
      row.parse_error = "line " + std::to_string(rec.line) + ": " + std::string(to_string(err));
      out.rows.push_back(std::move(row));
      if (!reader.skip_record()) break;
      continue;
    }
    if (is_blank_record(rec)) continue;
    if (!have_header) {
      header_fields = rec.fields.size();
      for (size_t i = 0; i < rec.fields.size(); ++i) {
        int idx = static_cast<int>(i);
        switch (classify_header(rec.fields[i])) {
          case Column::Name: if (name_col < 0) name_col = idx; break;
          case Column::DocumentNumber: if (doc_col < 0) doc_col = idx; break;
          case Column::Address: if (addr_col < 0) addr_col = idx; break;
          case Column::DocumentType: if (type_col < 0) type_col = idx; break;
          case Column::Other: break;
        }
      }
      if (name_col < 0 || doc_col < 0 || type_col < 0) {
        return malformed("header must name Full Name, Document Number and Document Type columns");
      }
      have_header = true;
      continue;
    }

    if (out.rows.size() >= cfg.max_rows) {
      return malformed("batch exceeds " + std::to_string(cfg.max_rows) + " rows");
    }
    BatchRow row{};
    row.row = out.rows.size() + 1;
    if (rec.fields.size() != header_fields) {
      row.well_formed = false;
      row.parse_error = "line " + std::to_string(rec.line) + ": expected " + std::to_string(header_fields) +
                        " fields, found " + std::to_string(rec.fields.size());
    } else {
      row.input.name = rec.fields[static_cast<size_t>(name_col)];
      row.input.document_number = rec.fields[static_cast<size_t>(doc_col)];
      if (addr_col >= 0) row.input.address = rec.fields[static_cast<size_t>(addr_col)];
      row.input.document_type = rec.fields[static_cast<size_t>(type_col)];
    }
    out.rows.push_back(std::move(row));
  }

  if (reader.error() != CsvError::None) {
    return malformed("line " + std::to_string(reader.error_line()) + ": " + std::string(to_string(reader.error())));
  }
  if (!have_header) return malformed("empty upload");

  out.ok = true;
  return out;
}

BatchRunner::BatchRunner(const BatchConfig& cfg, VerificationPipeline& pipeline,
                         ILogSink* log, IMetricSink* metrics)
    : cfg_(cfg),
      pipeline_(pipeline),
      log_(log ? log : &noop_log()),
      metrics_(metrics ? metrics : &noop_metrics()) {}

RowOutcome BatchRunner::run_row(const BatchRow& row, TimeMs now_ms) {
  RowOutcome o{};
  o.row = row.row;
  o.input = row.input;
  if (!row.well_formed) {
    o.state = PipelineState::Rejected;
    o.error = Error{ErrorKind::MalformedRow, row.parse_error};
    return o;
  }
  try {
    VerifyOutcome v = pipeline_.verify(row.input, now_ms);
    o.ok = v.ok;
    o.state = v.state;
    o.error = std::move(v.error);
    o.result = std::move(v.result);
  } catch (const std::exception& e) {
    o.ok = false;
    o.error = Error{ErrorKind::Internal, e.what()};
  }
  return o;
}

BatchSummary BatchRunner::run(const std::vector<BatchRow>& rows) {
  return run_impl(rows, nullptr);
}

BatchSummary BatchRunner::run(const std::vector<BatchRow>& rows, TimeMs now_ms) {
  return run_impl(rows, &now_ms);
}

BatchSummary BatchRunner::run_impl(const std::vector<BatchRow>& rows, const TimeMs* now) {
  BatchSummary s{};
  s.total = rows.size();
  s.results.resize(rows.size());

  std::atomic<size_t> next{0};
  auto work = [&]() {
    for (size_t i = next.fetch_add(1); i < rows.size(); i = next.fetch_add(1)) {
      s.results[i] = run_row(rows[i], now ? *now : now_ms());
    }
  };

  size_t workers = cfg_.max_workers == 0 ? 1 : cfg_.max_workers;
  if (workers > rows.size()) workers = rows.size();
  std::vector<std::thread> pool;
  for (size_t w = 1; w < workers; ++w) {
    try {
      pool.emplace_back(work);
    } catch (const std::system_error& e) {
      log_->log(LogLevel::Warn, kComponent, std::string("worker start failed, continuing with fewer: ") + e.what());
      break;
    }
  }
  work();
  for (auto& t : pool) t.join();

  for (const auto& r : s.results) {
    if (r.ok) ++s.successful;
    else ++s.failed;
    metrics_->inc_counter("kyc_batch_rows_total", 1, {{"outcome", r.ok ? "ok" : std::string(to_string(r.error.kind))}});
  }
  log_->log(LogLevel::Info, kComponent,
            "batch done total=" + std::to_string(s.total) + " successful=" + std::to_string(s.successful) +
                " failed=" + std::to_string(s.failed));
  return s;
}

BatchResult BatchRunner::run_csv(std::string_view text) {
  BatchResult res{};
  BatchParse parsed = parse_batch_csv(text, cfg_);
  if (!parsed.ok) {
    res.error = parsed.error;
    log_->log(LogLevel::Warn, kComponent, "upload rejected: " + parsed.error.message);
    return res;
  }
  res.summary = run(parsed.rows);
  res.ok = true;
  return res;
}

} // namespace kyc
