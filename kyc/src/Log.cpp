#include "kyc/Log.h"
#include "kyc/Metrics.h"
#include "kyc/Util.h"

namespace kyc {

std::string_view to_string(LogLevel l) {
  switch (l) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
  std::string t = to_lower(trim(text));
  if (t == "debug") return LogLevel::Debug;
  if (t == "info") return LogLevel::Info;
  if (t == "warn" || t == "warning") return LogLevel::Warn;
  if (t == "error") return LogLevel::Error;
  return std::nullopt;
}

NoopLogSink& noop_log() {
  static NoopLogSink sink;
  return sink;
}

NoopMetricSink& noop_metrics() {
  static NoopMetricSink sink;
  return sink;
}

StreamLogSink::StreamLogSink(std::FILE* out, LogLevel min_level)
    : out_(out), min_level_(min_level) {}

void StreamLogSink::log(LogLevel level, std::string_view component, std::string_view message) {
  if (!out_ || level < min_level_.load(std::memory_order_relaxed)) return;
  std::string ts = format_iso8601(now_ms());
  std::string_view lvl = to_string(level);
  std::lock_guard<std::mutex> lock(mu_);
  std::fprintf(out_, "%s %.*s %.*s: %.*s\n", ts.c_str(),
               static_cast<int>(lvl.size()), lvl.data(),
               static_cast<int>(component.size()), component.data(),
               static_cast<int>(message.size()), message.data());
  std::fflush(out_);
}

} // namespace kyc
