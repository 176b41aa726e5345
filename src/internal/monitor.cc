#include "procvisor/internal/monitor.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "procvisor/internal/log.hpp"

namespace procvisor::internal {

namespace {

enum class Source : std::uint8_t { timeout, cancel, abort };

constexpr std::array<Source, 3> kSources{Source::timeout, Source::cancel, Source::abort};

/// Event sources checked between exit polls. The first source checked
/// advances every round so that none of them starves the others.
class EventRace {
 public:
  explicit EventRace(MonitorEvents events) : events_(std::move(events)) {}

  std::optional<KillReason> poll() {
    const std::size_t first = rotation_++ % kSources.size();
    for (std::size_t i = 0; i < kSources.size(); ++i) {
      Source source = kSources[(first + i) % kSources.size()];
      if (fired(source)) {
        return source == Source::timeout ? KillReason::timeout : KillReason::cancelled;
      }
    }
    return std::nullopt;
  }

  void disarm() {
    events_.timeout.reset();
    events_.cancel.reset();
    events_.abort.reset();
  }

 private:
  bool fired(Source source) {
    switch (source) {
      case Source::timeout:
        return events_.timeout && events_.timeout->ready();
      case Source::cancel:
        return events_.cancel && events_.cancel->try_recv();
      case Source::abort:
        return events_.abort && events_.abort->try_recv();
    }
    return false;
  }

  MonitorEvents events_;
  std::size_t rotation_ = 0;
};

/// One supervised process: its observed status and whether it was killed.
class Tracked {
 public:
  explicit Tracked(ProcessOps& ops) : ops_(&ops) {}

  /// True once the process has been reaped.
  Result<bool> poll() {
    if (status_) {
      return true;
    }
    auto polled = ops_->try_wait();
    if (!polled) {
      return polled.error();
    }
    status_ = *polled;
    return status_.has_value();
  }

  Result<void> kill(const char* why) {
    if (status_ || killed_) {
      return {};
    }
    killed_ = true;
    log(LogLevel::trace, "killing `", ops_->name, "` (", why, ")");
    auto killed = ops_->kill();
    if (!killed) {
      log(LogLevel::warn, "failed to kill `", ops_->name, "`: ", killed.error().code.message());
    }
    return killed;
  }

  Result<ExitStatus> reap() {
    if (status_) {
      return *status_;
    }
    auto waited = ops_->wait_blocking();
    if (!waited) {
      return waited.error();
    }
    status_ = *waited;
    return *status_;
  }

  [[nodiscard]] const std::optional<ExitStatus>& status() const { return status_; }
  [[nodiscard]] const std::string& name() const { return ops_->name; }

 private:
  ProcessOps* ops_;
  std::optional<ExitStatus> status_;
  bool killed_ = false;
};

Result<MonitorOutcome> race(Tracked* upstream, Tracked& downstream, Clock& clock,
                            MonitorEvents events, std::chrono::milliseconds grace) {
  EventRace sources(std::move(events));
  KillReason reason = KillReason::none;
  std::optional<Clock::time_point> upstream_exited_at;

  // Every stage is signaled even if an earlier one fails; the first error wins.
  auto kill = [&](KillReason why) -> Result<void> {
    reason = why;
    sources.disarm();
    Result<void> first_error;
    // The consumer outliving its producer is the only case that spares the producer.
    if (upstream != nullptr && why != KillReason::upstream_exit) {
      first_error = upstream->kill(to_string(why));
    }
    auto killed = downstream.kill(to_string(why));
    if (first_error && !killed) {
      first_error = killed;
    }
    return first_error;
  };

  // No stage may outlive a failed monitor: the caller is still draining its pipes.
  auto fail = [&](Error error) -> Result<MonitorOutcome> {
    if (upstream != nullptr) {
      (void)upstream->kill("monitor failure");  // failures are logged by kill()
    }
    (void)downstream.kill("monitor failure");
    return error;
  };

  while (true) {
    auto exited = downstream.poll();
    if (!exited) {
      return fail(exited.error());
    }
    if (*exited) {
      break;
    }

    if (upstream != nullptr && !upstream_exited_at) {
      auto upstream_done = upstream->poll();
      if (!upstream_done) {
        return fail(upstream_done.error());
      }
      if (*upstream_done) {
        upstream_exited_at = clock.now();
        log(LogLevel::trace, "`", upstream->name(), "` exited with ", to_string(*upstream->status()));
      }
    }

    if (reason == KillReason::none) {
      std::optional<KillReason> fired = sources.poll();
      if (!fired && upstream_exited_at && clock.now() - *upstream_exited_at >= grace) {
        fired = KillReason::upstream_exit;
      }
      if (fired) {
        // A process that already finished keeps its own status.
        auto finished = downstream.poll();
        if (!finished) {
          return fail(finished.error());
        }
        if (*finished) {
          break;
        }
        auto killed = kill(*fired);
        if (!killed) {
          return fail(killed.error());
        }
      }
    }

    clock.sleep_for(kMonitorPollInterval);
  }

  const ExitStatus status = *downstream.status();
  log(LogLevel::trace, "`", downstream.name(), "` exited with ", to_string(status));

  if (upstream != nullptr) {
    auto killed = upstream->kill("consumer exited");
    if (!killed) {
      return killed.error();
    }
    auto reaped = upstream->reap();
    if (!reaped) {
      return reaped.error();
    }
  }

  if (status.kind() == ExitStatus::Kind::exited) {
    reason = KillReason::none;
  }
  return MonitorOutcome{.status = status, .kill_reason = reason};
}

}  // namespace

Result<MonitorOutcome> monitor_process(ProcessOps& process, Clock& clock, MonitorEvents events) {
  Tracked tracked(process);
  return race(nullptr, tracked, clock, std::move(events), std::chrono::milliseconds::zero());
}

Result<MonitorOutcome> monitor_pipeline(ProcessOps& upstream, ProcessOps& downstream,
                                        Clock& clock, MonitorEvents events,
                                        std::chrono::milliseconds downstream_grace) {
  Tracked producer(upstream);
  Tracked consumer(downstream);
  return race(&producer, consumer, clock, std::move(events), downstream_grace);
}

}  // namespace procvisor::internal
