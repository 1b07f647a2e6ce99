#include "kyc/Csv.h"
#include "kyc/Util.h"

namespace kyc {

std::string_view to_string(CsvError e) {
  switch (e) {
    case CsvError::None: return "none";
    case CsvError::UnterminatedQuote: return "unterminated quoted field";
    case CsvError::StrayQuote: return "unexpected quote inside unquoted field";
    case CsvError::RecordTooLarge: return "record too large";
    case CsvError::TooManyFields: return "too many fields";
  }
  return "unknown";
}

CsvReader::CsvReader(std::string_view text, const CsvConfig& cfg) : text_(text), cfg_(cfg) {
  // UTF-8 BOM from spreadsheet exports.
  if (text_.size() >= 3 && static_cast<unsigned char>(text_[0]) == 0xEF &&
      static_cast<unsigned char>(text_[1]) == 0xBB && static_cast<unsigned char>(text_[2]) == 0xBF) {
    pos_ = 3;
  }
}

bool CsvReader::fail(CsvError e, bool quoted) {
  error_ = e;
  error_line_ = line_;
  error_quoted_ = quoted;
  return false;
}

bool CsvReader::skip_record() {
  if (error_ != CsvError::RecordTooLarge && error_ != CsvError::TooManyFields) return false;
  bool quoted = error_quoted_;
  while (pos_ < text_.size()) {
    char c = text_[pos_++];
    if (c == '"') {
      quoted = !quoted;
    } else if (quoted) {
      if (c == '\n') ++line_;
    } else if (c == '\n' || c == '\r') {
      if (c == '\r' && pos_ < text_.size() && text_[pos_] == '\n') ++pos_;
      ++line_;
      error_ = CsvError::None;
      return true;
    }
  }
  if (quoted) return fail(CsvError::UnterminatedQuote);
  error_ = CsvError::None;
  return true;
}

bool CsvReader::next(CsvRecord& out) {
  if (error_ != CsvError::None) return false;
  if (pos_ >= text_.size()) return false;

  out.fields.clear();
  out.line = line_;
  std::string field;
  bool quoted = false;
  bool after_quote = false;
  size_t record_bytes = 0;

  while (pos_ < text_.size()) {
    if (++record_bytes > cfg_.max_record_bytes) return fail(CsvError::RecordTooLarge, quoted);
    char c = text_[pos_++];

    if (quoted) {
      if (c == '"') {
        if (pos_ < text_.size() && text_[pos_] == '"') {
          field.push_back('"');
          ++pos_;
        } else {
          quoted = false;
          after_quote = true;
        }
      } else {
        if (c == '\n') ++line_;
        field.push_back(c);
      }
      continue;
    }

    if (c == cfg_.delimiter) {
      if (out.fields.size() + 1 >= cfg_.max_fields) return fail(CsvError::TooManyFields);
      out.fields.push_back(std::move(field));
      field.clear();
      after_quote = false;
    } else if (c == '\n' || c == '\r') {
      if (c == '\r' && pos_ < text_.size() && text_[pos_] == '\n') ++pos_;
      ++line_;
      out.fields.push_back(std::move(field));
      return true;
    } else if (c == '"') {
      if (!field.empty() || after_quote) return fail(CsvError::StrayQuote);
      quoted = true;
    } else {
      if (after_quote) return fail(CsvError::StrayQuote);
      field.push_back(c);
    }
  }

  if (quoted) return fail(CsvError::UnterminatedQuote);
  out.fields.push_back(std::move(field));
  return true;
}

CsvError csv_split_line(std::string_view line, std::vector<std::string>& out, const CsvConfig& cfg) {
  out.clear();
  if (line.find('\n') != std::string_view::npos) return CsvError::StrayQuote;
  CsvReader reader(line, cfg);
  CsvRecord rec;
  if (!reader.next(rec)) {
    return reader.error() == CsvError::None ? CsvError::None : reader.error();
  }
  out = std::move(rec.fields);
  return CsvError::None;
}

std::string csv_escape(std::string_view field, char delimiter) {
  std::string flat;
  flat.reserve(field.size());
  for (char c : field) {
    flat.push_back((c == '\n' || c == '\r') ? ' ' : c);
  }
  bool needs_quotes = flat.find(delimiter) != std::string::npos ||
                      flat.find('"') != std::string::npos ||
                      (!flat.empty() && (flat.front() == ' ' || flat.back() == ' '));
  if (!needs_quotes) return flat;
  std::string out;
  out.reserve(flat.size() + 2);
  out.push_back('"');
  for (char c : flat) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string csv_join(const std::vector<std::string>& fields, char delimiter) {
  std::string out;
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) out.push_back(delimiter);
    out += csv_escape(fields[i], delimiter);
  }
  return out;
}

bool is_blank_record(const CsvRecord& r) {
  for (const auto& f : r.fields) {
    if (!trim(f).empty()) return false;
  }
  return true;
}

} // namespace kyc
