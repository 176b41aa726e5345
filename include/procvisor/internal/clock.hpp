#pragma once

#include <chrono>

namespace procvisor::internal {

/// @brief Time source for the monitor; replaceable for tests.
class Clock {
 public:
  using time_point = std::chrono::steady_clock::time_point;

  virtual ~Clock() = default;
  virtual time_point now() = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class ScopedClockOverride {
 public:
  explicit ScopedClockOverride(Clock& clock);
  ~ScopedClockOverride();
  ScopedClockOverride(const ScopedClockOverride&) = delete;
  ScopedClockOverride& operator=(const ScopedClockOverride&) = delete;

 private:
  Clock* previous_ = nullptr;
};

Clock& default_clock();

/// @brief Periodic tick source started at construction.
///
/// ready() reports each elapsed period once, so a tick that is not acted on
/// is not repeated until the next period.
class Ticker {
 public:
  Ticker(Clock& clock, std::chrono::milliseconds period);

  /// @brief Consume a due tick, if any.
  bool ready();

 private:
  Clock* clock_;
  std::chrono::milliseconds period_;
  Clock::time_point next_;
};

}  // namespace procvisor::internal
