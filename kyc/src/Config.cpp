#include "kyc/Config.h"
#include "kyc/Artifacts.h"
#include "kyc/Util.h"

namespace kyc {

namespace {

bool parse_bool(std::string_view s, bool& out) {
  std::string v = to_lower(s);
  if (v == "true" || v == "1" || v == "yes" || v == "on") {
    out = true;
    return true;
  }
  if (v == "false" || v == "0" || v == "no" || v == "off") {
    out = false;
    return true;
  }
  return false;
}

bool parse_percent(std::string_view s, double& out) {
  return parse_double(s, out) && out >= 0.0 && out <= 100.0;
}

// Empty string on success, otherwise what was wrong with the value.
std::string apply(KycConfig& cfg, std::string_view key, std::string_view value) {
  auto& m = cfg.model;
  auto& risk = cfg.pipeline.risk;
  auto& val = cfg.pipeline.validation;

  if (key == "model.classifier") m.classifier_path = std::string(value);
  else if (key == "model.selector") m.selector_path = std::string(value);
  else if (key == "model.scaler") m.scaler_path = std::string(value);
  else if (key == "model.fallback") m.fallback_path = std::string(value);
  else if (key == "model.safe_default") {
    double p = 0.0;
    if (!parse_double(value, p) || p <= 0.0 || p >= 1.0) return "expected a probability strictly between 0 and 1";
    m.safe_default_probability = p;
  } else if (key == "risk.low_upper") {
    if (!parse_percent(value, risk.low_upper)) return "expected a percentage";
  } else if (key == "risk.high_lower") {
    if (!parse_percent(value, risk.high_lower)) return "expected a percentage";
  } else if (key == "risk.address_min_len") {
    if (!parse_size(value, risk.address_verified_min_len)) return "expected a non-negative integer";
  } else if (key == "validation.max_name_len") {
    if (!parse_size(value, val.max_name_len) || val.max_name_len == 0) return "expected a positive integer";
  } else if (key == "validation.max_document_number_len") {
    if (!parse_size(value, val.max_document_number_len) || val.max_document_number_len == 0) {
      return "expected a positive integer";
    }
  } else if (key == "validation.max_address_len") {
    if (!parse_size(value, val.max_address_len)) return "expected a non-negative integer";
  } else if (key == "audit.path") {
    cfg.audit.path = std::string(value);
  } else if (key == "audit.sync") {
    if (!parse_bool(value, cfg.audit.sync_on_append)) return "expected true or false";
  } else if (key == "batch.max_workers") {
    if (!parse_size(value, cfg.batch.max_workers) || cfg.batch.max_workers == 0) return "expected a positive integer";
  } else if (key == "batch.max_rows") {
    if (!parse_size(value, cfg.batch.max_rows) || cfg.batch.max_rows == 0) return "expected a positive integer";
  } else if (key == "log.level") {
    auto l = parse_log_level(value);
    if (!l) return "expected debug, info, warn or error";
    cfg.log.level = *l;
  } else {
    return "unknown key";
  }
  return {};
}

} // namespace

ConfigResult parse_config(std::string_view text, KycConfig& cfg, std::string_view origin) {
  ConfigResult res{};
  KycConfig next = cfg;
  size_t line_no = 0;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t end = text.find('\n', pos);
    if (end == std::string_view::npos) end = text.size();
    std::string_view line = text.substr(pos, end - pos);
    pos = end + 1;
    ++line_no;

    size_t hash = line.find('#');
    if (hash != std::string_view::npos) line = line.substr(0, hash);
    line = trim(line);
    if (line.empty()) continue;

    size_t sp = line.find_first_of(" \t");
    std::string_view key = line.substr(0, sp);
    std::string_view value = sp == std::string_view::npos ? std::string_view{} : trim(line.substr(sp));
    std::string where = std::string(origin) + ":" + std::to_string(line_no) + ": ";
    if (value.empty()) {
      res.error = where + "missing value for '" + std::string(key) + "'";
      return res;
    }
    std::string why = apply(next, key, value);
    if (!why.empty()) {
      res.error = where + std::string(key) + ": " + why;
      return res;
    }
  }

  if (next.pipeline.risk.low_upper > next.pipeline.risk.high_lower) {
    res.error = std::string(origin) + ": risk.low_upper must not exceed risk.high_lower";
    return res;
  }
  cfg = std::move(next);
  res.ok = true;
  return res;
}

ConfigResult load_config(const std::string& path, KycConfig& cfg) {
  std::string text;
  std::string error;
  if (!read_text_file(path, text, error)) {
    ConfigResult res{};
    res.error = error;
    return res;
  }
  return parse_config(text, cfg, path);
}

} // namespace kyc
