#pragma once
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace kyc {

enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

std::string_view to_string(LogLevel l);
std::optional<LogLevel> parse_log_level(std::string_view text);

// Implementations must be safe to call from concurrent requests.
class ILogSink {
 public:
  virtual ~ILogSink() = default;
  virtual void log(LogLevel level, std::string_view component, std::string_view message) = 0;
};

class NoopLogSink final : public ILogSink {
 public:
  void log(LogLevel, std::string_view, std::string_view) override {}
};

NoopLogSink& noop_log();

// One line per event: "2026-10-19T08:15:02.117Z WARN model_bundle: ..."
class StreamLogSink final : public ILogSink {
 public:
  explicit StreamLogSink(std::FILE* out = stderr, LogLevel min_level = LogLevel::Info);
  void log(LogLevel level, std::string_view component, std::string_view message) override;
  // Safe to call while other threads log.
  void set_min_level(LogLevel l) { min_level_.store(l, std::memory_order_relaxed); }

 private:
  std::FILE* out_{nullptr};
  std::atomic<LogLevel> min_level_{LogLevel::Info};
  std::mutex mu_;
};

} // namespace kyc
