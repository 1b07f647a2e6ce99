#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "Common.h"
#include "Csv.h"
#include "Log.h"
#include "Metrics.h"
#include "Pipeline.h"

namespace kyc {

struct BatchRow {
  size_t row{0}; // 1-based among non-blank data rows
  bool well_formed{true};
  std::string parse_error;
  IdentityInput input{};
};

struct BatchParse {
  bool ok{false};
  Error error{};
  std::vector<BatchRow> rows;
};

struct BatchConfig {
  size_t max_workers{1};
  size_t max_rows{10000};
  CsvConfig csv{};
};

// Header names are matched ignoring case, spaces, '_' and '-':
// "Full Name"/"Name", "Document Number", "Address" (optional), "Document Type"/"ID_Type".
// Fails as a whole on empty input, a missing required column, a broken
// quoted field or more than max_rows rows. A row whose field count differs
// from the header is kept and marked malformed.
BatchParse parse_batch_csv(std::string_view text, const BatchConfig& cfg = {});

struct RowOutcome {
  size_t row{0};
  bool ok{false};
  PipelineState state{PipelineState::Received};
  IdentityInput input{};
  VerificationResult result{};
  Error error{};
};

struct BatchSummary {
  size_t total{0};
  size_t successful{0};
  size_t failed{0};
  std::vector<RowOutcome> results; // same order as the input rows
};

struct BatchResult {
  bool ok{false};
  Error error{};
  BatchSummary summary{};
};

class BatchRunner {
 public:
  BatchRunner(const BatchConfig& cfg, VerificationPipeline& pipeline,
              ILogSink* log = nullptr, IMetricSink* metrics = nullptr);

  // A failing row never stops the others.
  BatchSummary run(const std::vector<BatchRow>& rows);
  BatchSummary run(const std::vector<BatchRow>& rows, TimeMs now_ms);
  BatchResult run_csv(std::string_view text);

 private:
  RowOutcome run_row(const BatchRow& row, TimeMs now_ms);
  BatchSummary run_impl(const std::vector<BatchRow>& rows, const TimeMs* now_ms);

  BatchConfig cfg_{};
  VerificationPipeline& pipeline_;
  ILogSink* log_{nullptr};
  IMetricSink* metrics_{nullptr};
};

} // namespace kyc
