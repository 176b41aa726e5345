#include "procvisor/internal/clock.hpp"

#include <atomic>
#include <thread>

namespace procvisor::internal {

namespace {

class MonotonicClock final : public Clock {
 public:
  time_point now() override { return std::chrono::steady_clock::now(); }
  void sleep_for(std::chrono::milliseconds duration) override { std::this_thread::sleep_for(duration); }
};

std::atomic<Clock*> g_clock{nullptr};

}  // namespace

ScopedClockOverride::ScopedClockOverride(Clock& clock) : previous_(g_clock.exchange(&clock)) {}

ScopedClockOverride::~ScopedClockOverride() { g_clock.store(previous_); }

Clock& default_clock() {
  Clock* installed = g_clock.load();
  if (installed != nullptr) {
    return *installed;
  }
  static MonotonicClock monotonic;
  return monotonic;
}

Ticker::Ticker(Clock& clock, std::chrono::milliseconds period)
    : clock_(&clock), period_(period), next_(clock.now() + period) {}

bool Ticker::ready() {
  if (clock_->now() < next_) {
    return false;
  }
  next_ += period_;
  return true;
}

}  // namespace procvisor::internal
