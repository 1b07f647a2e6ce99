#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kyc {

enum class CsvError : uint8_t {
  None = 0,
  UnterminatedQuote,
  StrayQuote,
  RecordTooLarge,
  TooManyFields,
};

std::string_view to_string(CsvError e);

struct CsvConfig {
  char delimiter{','};
  size_t max_record_bytes{64 * 1024};
  size_t max_fields{64};
};

struct CsvRecord {
  std::vector<std::string> fields;
  size_t line{0}; // 1-based line the record starts on
};

// RFC 4180 reader over an in-memory buffer. Quoted fields may span lines.
// Stops at the first structural error; records already returned stay valid.
// A record that is only over a size limit can be stepped over with
// skip_record() and reading resumes at the next record.
class CsvReader {
 public:
  CsvReader(std::string_view text, const CsvConfig& cfg = {});

  // False at end of input or on error; check error() to tell them apart.
  bool next(CsvRecord& out);
  CsvError error() const { return error_; }
  size_t error_line() const { return error_line_; }

  // After RecordTooLarge or TooManyFields: consume the rest of the failed
  // record and clear the error. False for any other state, or when the rest
  // of the input holds an unterminated quote (error() then reports it).
  bool skip_record();

 private:
  bool fail(CsvError e, bool quoted = false);

  std::string_view text_;
  CsvConfig cfg_{};
  size_t pos_{0};
  size_t line_{1};
  CsvError error_{CsvError::None};
  size_t error_line_{0};
  bool error_quoted_{false};
};

// One physical line, no embedded newlines.
CsvError csv_split_line(std::string_view line, std::vector<std::string>& out,
                        const CsvConfig& cfg = {});

// Quotes only when needed. Line breaks inside a field become spaces so a
// record always stays on one physical line.
std::string csv_escape(std::string_view field, char delimiter = ',');
std::string csv_join(const std::vector<std::string>& fields, char delimiter = ',');

bool is_blank_record(const CsvRecord& r);

} // namespace kyc
