#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "procvisor/cancel.hpp"
#include "procvisor/internal/clock.hpp"
#include "procvisor/result.hpp"
#include "procvisor/status.hpp"

namespace procvisor::internal {

/// @brief Poll interval between non-blocking exit checks.
inline constexpr std::chrono::milliseconds kMonitorPollInterval{1};

/// @brief Operations the monitor performs on one supervised process.
struct ProcessOps {
  /// @brief Label used in log lines, usually the command display string.
  std::string name;
  std::function<Result<std::optional<ExitStatus>>()> try_wait;
  std::function<Result<ExitStatus>()> wait_blocking;
  std::function<Result<void>()> kill;
};

/// @brief Event sources raced against the process exit. All are optional.
struct MonitorEvents {
  std::optional<Ticker> timeout;
  std::optional<CancelReceiver> cancel;
  /// @brief Internal abort used when the caller gives up on the run.
  std::optional<CancelReceiver> abort;
};

/// @brief What the monitor observed for the process that decides the run.
struct MonitorOutcome {
  ExitStatus status;
  KillReason kill_reason = KillReason::none;
};

/// @brief Race one process against its events until it exits.
Result<MonitorOutcome> monitor_process(ProcessOps& process, Clock& clock, MonitorEvents events);

/// @brief Race a producer/consumer pair; the consumer's exit ends the run.
///
/// The producer is reaped as soon as it exits. If the consumer is still running
/// downstream_grace after that, it is killed. Timeout and cancellation kill both.
/// A producer still running after the consumer exits is killed and reaped.
Result<MonitorOutcome> monitor_pipeline(ProcessOps& upstream, ProcessOps& downstream,
                                        Clock& clock, MonitorEvents events,
                                        std::chrono::milliseconds downstream_grace);

}  // namespace procvisor::internal
