#include "procvisor/internal/supervisor.hpp"

#include <exception>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>
#include <variant>

#include "procvisor/internal/access.hpp"
#include "procvisor/internal/backend.hpp"
#include "procvisor/internal/clock.hpp"
#include "procvisor/internal/io_drain.hpp"
#include "procvisor/internal/log.hpp"
#include "procvisor/internal/lowering.hpp"
#include "procvisor/internal/monitor.hpp"
#include "procvisor/internal/status_cell.hpp"
#include "procvisor/pipe.hpp"

namespace procvisor::internal {

namespace {

using OutcomeCell = StatusCell<Result<MonitorOutcome>>;

/// Processes handed to one monitor thread. upstream is set for pipes only.
struct Launch {
  std::optional<Spawned> upstream;
  std::string upstream_name;
  Spawned downstream;
  std::string downstream_name;
  MonitorEvents events;
  std::chrono::milliseconds grace{Command::kDefaultDownstreamGrace};
};

// Guarantees the caller is released even if the monitor body unwinds.
class CellGuard {
 public:
  explicit CellGuard(std::shared_ptr<OutcomeCell> cell) : cell_(std::move(cell)) {}
  CellGuard(const CellGuard&) = delete;
  CellGuard& operator=(const CellGuard&) = delete;
  ~CellGuard() {
    cell_->set(Error{.code = make_error_code(errc::wait_failed), .context = "indeterminate status"});
  }

 private:
  std::shared_ptr<OutcomeCell> cell_;
};

ProcessOps process_ops(Backend& backend, Spawned& spawned, std::string name) {
  ProcessOps ops;
  ops.name = std::move(name);
  ops.try_wait = [&backend, &spawned] { return backend.try_wait(spawned); };
  ops.wait_blocking = [&backend, &spawned] { return backend.wait(spawned); };
  ops.kill = [&backend, &spawned] { return backend.kill(spawned); };
  return ops;
}

Result<MonitorOutcome> run_monitor(Launch& launch, Backend& backend, Clock& clock) {
  ProcessOps downstream = process_ops(backend, launch.downstream, launch.downstream_name);
  if (!launch.upstream) {
    return monitor_process(downstream, clock, std::move(launch.events));
  }
  ProcessOps upstream = process_ops(backend, *launch.upstream, launch.upstream_name);
  return monitor_pipeline(upstream, downstream, clock, std::move(launch.events), launch.grace);
}

// Kill and reap a process the caller will not supervise.
void discard(Backend& backend, Spawned& spawned) {
  auto killed = backend.kill(spawned);
  if (!killed) {
    log(LogLevel::warn, "failed to kill pid ", spawned.pid, ": ", killed.error().code.message());
    return;
  }
  auto reaped = backend.wait(spawned);
  if (!reaped) {
    log(LogLevel::warn, "failed to reap pid ", spawned.pid, ": ", reaped.error().code.message());
  }
}

void join_monitor(std::thread& monitor) {
  try {
    monitor.join();
  } catch (const std::system_error& ex) {
    log(LogLevel::warn, "failed to join monitor thread: ", ex.what());
  }
}

MonitorEvents events_for(const Command& cmd, Clock& clock, CancelReceiver abort) {
  MonitorEvents events;
  if (const auto& timeout = CommandAccess::timeout(cmd)) {
    events.timeout.emplace(clock, *timeout);
  }
  events.cancel = CommandAccess::cancel(cmd);
  events.abort.emplace(std::move(abort));
  return events;
}

// Signals reach this run only while it is attached to the channel.
void attach_cancel(const Command& cmd, std::optional<CancelScope>& scope) {
  if (const auto& cancel = CommandAccess::cancel(cmd)) {
    scope.emplace(*cancel);
  }
}

void log_invocation(const Command& cmd) {
  if (CommandAccess::debug(cmd)) {
    log(LogLevel::debug, "Executing `", cmd.display(), "`...");
  }
}

// Parent end of a piped stdin is closed so the child sees EOF.
void close_stdin(Spawned& spawned) {
  if (spawned.stdin_fd) {
    PipeWriter writer(*spawned.stdin_fd);
    spawned.stdin_fd.reset();
  }
}

std::optional<PipeReader> take_reader(std::optional<int>& fd) {
  if (!fd) {
    return std::nullopt;
  }
  std::optional<PipeReader> reader(std::in_place, *fd);
  fd.reset();
  return reader;
}

Result<Output> supervise_launch(Launch launch, Backend& backend, Clock& clock, CancelSender abort) {
  std::optional<PipeReader> stdout_pipe = take_reader(launch.downstream.stdout_fd);
  std::optional<PipeReader> stderr_pipe = take_reader(launch.downstream.stderr_fd);

  // Copies of the process records in case the monitor never starts.
  std::optional<Spawned> upstream_record = launch.upstream;
  Spawned downstream_record = launch.downstream;

  auto cell = std::make_shared<OutcomeCell>();
  std::thread monitor;
  try {
    monitor = std::thread([cell, &backend, &clock, launch = std::move(launch)]() mutable {
      CellGuard guard(cell);
      try {
        cell->set(run_monitor(launch, backend, clock));
      } catch (const std::exception& ex) {
        cell->set(Error{.code = make_error_code(errc::wait_failed), .context = ex.what()});
      }
    });
  } catch (const std::system_error& ex) {
    log(LogLevel::warn, "failed to start monitor thread: ", ex.what());
    discard(backend, downstream_record);
    if (upstream_record) {
      discard(backend, *upstream_record);
    }
    return Error{.code = make_error_code(errc::thread_failed), .context = "monitor thread"};
  }

  auto drained = drain_pipes(stdout_pipe ? &*stdout_pipe : nullptr,
                             stderr_pipe ? &*stderr_pipe : nullptr);
  if (!drained) {
    abort.send();
  }

  std::optional<Result<MonitorOutcome>> outcome;
  while (!outcome) {
    outcome = cell->wait_for(kStatusRecheckInterval);
  }
  join_monitor(monitor);

  if (!drained) {
    return drained.error();
  }
  if (!*outcome) {
    return outcome->error();
  }

  Output output;
  output.status = outcome->value().status;
  output.kill_reason = outcome->value().kill_reason;
  output.stdout_data = std::move(drained->stdout_data);
  output.stderr_data = std::move(drained->stderr_data);
  return output;
}

}  // namespace

Result<Output> supervise(const Command& cmd) {
  log_invocation(cmd);
  std::optional<CancelScope> cancel_scope;
  attach_cancel(cmd, cancel_scope);
  auto spec = lower_command(cmd, SpawnMode::output, nullptr);
  if (!spec) {
    return spec.error();
  }
  Backend& backend = default_backend();
  auto spawned = backend.spawn(*spec);
  if (!spawned) {
    return spawned.error();
  }
  close_stdin(*spawned);

  Clock& clock = default_clock();
  auto [abort_sender, abort_receiver] = make_cancel_channel();
  Launch launch;
  launch.downstream = std::move(*spawned);
  launch.downstream_name = cmd.display();
  launch.events = events_for(cmd, clock, std::move(abort_receiver));
  return supervise_launch(std::move(launch), backend, clock, std::move(abort_sender));
}

Result<Output> supervise_pipe(const Command& first, const Command& second) {
  if (const auto& err = CommandAccess::stderr_opt(first);
      err && std::holds_alternative<Stdio::Piped>(err->value)) {
    return Error{.code = make_error_code(errc::invalid_stdio), .context = "upstream stderr"};
  }

  log_invocation(first);
  log_invocation(second);
  std::optional<CancelScope> cancel_scope;
  attach_cancel(first, cancel_scope);

  StdioOverride upstream_stdio;
  upstream_stdio.stdout_override = Stdio::piped();
  auto upstream_spec = lower_command(first, SpawnMode::spawn, &upstream_stdio);
  if (!upstream_spec) {
    return upstream_spec.error();
  }

  Backend& backend = default_backend();
  auto upstream = backend.spawn(*upstream_spec);
  if (!upstream) {
    return upstream.error();
  }
  close_stdin(*upstream);
  std::optional<PipeReader> upstream_out = take_reader(upstream->stdout_fd);
  if (!upstream_out) {
    discard(backend, *upstream);
    return Error{.code = make_error_code(errc::pipe_failed), .context = "upstream stdout"};
  }

  StdioOverride downstream_stdio;
  downstream_stdio.stdin_override = std::move(*upstream_out).into_stdin();
  auto downstream_spec = lower_command(second, SpawnMode::output, &downstream_stdio);
  if (!downstream_spec) {
    discard(backend, *upstream);
    return downstream_spec.error();
  }
  auto downstream = backend.spawn(*downstream_spec);
  // The consumer holds its own copy of the read end now.
  downstream_stdio.stdin_override.reset();
  if (!downstream) {
    discard(backend, *upstream);
    return downstream.error();
  }
  close_stdin(*downstream);

  Clock& clock = default_clock();
  auto [abort_sender, abort_receiver] = make_cancel_channel();
  Launch launch;
  launch.upstream = std::move(*upstream);
  launch.upstream_name = first.display();
  launch.downstream = std::move(*downstream);
  launch.downstream_name = second.display();
  launch.events = events_for(first, clock, std::move(abort_receiver));
  launch.grace = CommandAccess::downstream_grace(first);
  return supervise_launch(std::move(launch), backend, clock, std::move(abort_sender));
}

}  // namespace procvisor::internal
