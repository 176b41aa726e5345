#pragma once

#include <cstdint>
#include <sstream>
#include <string_view>
#include <utility>

namespace procvisor::internal {

enum class LogLevel : std::uint8_t { trace, debug, info, warn, error, off };

/// @brief Lowercase level name.
const char* to_string(LogLevel level) noexcept;
/// @brief Parse a level name; unknown or empty text yields fallback.
LogLevel parse_log_level(std::string_view text, LogLevel fallback) noexcept;

/// @brief Destination for library log lines; replaceable for tests.
class Logger {
 public:
  virtual ~Logger() = default;
  [[nodiscard]] virtual bool enabled(LogLevel level) const = 0;
  virtual void write(LogLevel level, std::string_view message) = 0;
};

class ScopedLoggerOverride {
 public:
  explicit ScopedLoggerOverride(Logger& logger);
  ~ScopedLoggerOverride();
  ScopedLoggerOverride(const ScopedLoggerOverride&) = delete;
  ScopedLoggerOverride& operator=(const ScopedLoggerOverride&) = delete;

 private:
  Logger* previous_ = nullptr;
};

/// @brief Overriding logger, else a stderr logger with its threshold read from PROCVISOR_LOG.
Logger& default_logger();

/// @brief Stream every part into one line; nothing is built when the level is off.
template <typename... Parts>
void log(LogLevel level, Parts&&... parts) {
  Logger& logger = default_logger();
  if (!logger.enabled(level)) {
    return;
  }
  std::ostringstream line;
  (line << ... << std::forward<Parts>(parts));
  logger.write(level, line.str());
}

}  // namespace procvisor::internal
