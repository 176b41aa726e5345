#include "procvisor/internal/log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace procvisor::internal {

namespace {

constexpr LogLevel kDefaultThreshold = LogLevel::warn;

class StderrLogger final : public Logger {
 public:
  explicit StderrLogger(LogLevel threshold) : threshold_(threshold) {}

  [[nodiscard]] bool enabled(LogLevel level) const override {
    return level != LogLevel::off && level >= threshold_;
  }

  void write(LogLevel level, std::string_view message) override {
    std::lock_guard lock(mutex_);
    std::cerr << "[procvisor] " << to_string(level) << ": " << message << '\n' << std::flush;
  }

 private:
  LogLevel threshold_;
  std::mutex mutex_;
};

LogLevel threshold_from_env() {
  const char* value = std::getenv("PROCVISOR_LOG");
  return parse_log_level(value != nullptr ? value : "", kDefaultThreshold);
}

std::atomic<Logger*> g_logger{nullptr};

}  // namespace

const char* to_string(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::trace:
      return "trace";
    case LogLevel::debug:
      return "debug";
    case LogLevel::info:
      return "info";
    case LogLevel::warn:
      return "warn";
    case LogLevel::error:
      return "error";
    case LogLevel::off:
      return "off";
  }
  return "unknown";
}

LogLevel parse_log_level(std::string_view text, LogLevel fallback) noexcept {
  for (auto level : {LogLevel::trace, LogLevel::debug, LogLevel::info, LogLevel::warn,
                     LogLevel::error, LogLevel::off}) {
    if (text == to_string(level)) {
      return level;
    }
  }
  return fallback;
}

ScopedLoggerOverride::ScopedLoggerOverride(Logger& logger)
    : previous_(g_logger.exchange(&logger)) {}

ScopedLoggerOverride::~ScopedLoggerOverride() { g_logger.store(previous_); }

Logger& default_logger() {
  if (Logger* installed = g_logger.load()) {
    return *installed;
  }
  static StderrLogger logger(threshold_from_env());
  return logger;
}

}  // namespace procvisor::internal
