#include "procvisor/result.hpp"

#include <stdexcept>
#include <utility>

namespace procvisor {

namespace {

class procvisor_error_category : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "procvisor"; }

  [[nodiscard]] std::string message(int value) const override {
    switch (static_cast<errc>(value)) {
      case errc::ok:
        return "ok";
      case errc::empty_argv:
        return "empty argv";
      case errc::invalid_stdio:
        return "invalid stdio";
      case errc::pipe_failed:
        return "pipe failed";
      case errc::spawn_failed:
        return "spawn failed";
      case errc::wait_failed:
        return "wait failed";
      case errc::read_failed:
        return "read failed";
      case errc::write_failed:
        return "write failed";
      case errc::dup_failed:
        return "dup failed";
      case errc::chdir_failed:
        return "chdir failed";
      case errc::kill_failed:
        return "kill failed";
      case errc::thread_failed:
        return "monitor thread failed";
      case errc::exit_failure:
        return "process exited unsuccessfully";
      case errc::signaled:
        return "process terminated by signal";
      case errc::timeout:
        return "process killed after timeout";
      case errc::cancelled:
        return "process killed by cancellation";
    }
    return "unknown error";
  }
};

std::string describe(const Error& error) {
  std::string text = error.context.empty() ? error.code.message()
                                           : error.context + ": " + error.code.message();
  if (error.failure && error.failure->status) {
    text += " (" + to_string(*error.failure->status) + ")";
  }
  return text;
}

}  // namespace

const std::error_category& error_category() noexcept {
  static procvisor_error_category category;
  return category;
}

std::error_code make_error_code(errc value) noexcept {
  return {static_cast<int>(value), error_category()};
}

FailureKind classify(const Error& error) noexcept {
  if (error.code.category() != error_category()) {
    // Raw errno values; anything raised while spawning is tagged "spawn".
    return error.context.starts_with("spawn") ? FailureKind::spawn_failure
                                              : FailureKind::io_failure;
  }
  switch (static_cast<errc>(error.code.value())) {
    case errc::ok:
    case errc::empty_argv:
    case errc::invalid_stdio:
      return FailureKind::usage;
    case errc::spawn_failed:
    case errc::pipe_failed:
    case errc::dup_failed:
    case errc::chdir_failed:
      return FailureKind::spawn_failure;
    case errc::wait_failed:
    case errc::read_failed:
    case errc::write_failed:
    case errc::kill_failed:
    case errc::thread_failed:
      return FailureKind::io_failure;
    case errc::exit_failure:
      return FailureKind::abnormal_exit;
    case errc::signaled:
    case errc::timeout:
    case errc::cancelled:
      return FailureKind::killed;
  }
  return FailureKind::io_failure;
}

Result<std::string> into_result(Output output) {
  if (output.status.success() && output.stderr_data.empty()) {
    return std::move(output.stdout_data);
  }

  errc code = errc::exit_failure;
  switch (output.kill_reason) {
    case KillReason::timeout:
      code = errc::timeout;
      break;
    case KillReason::cancelled:
      code = errc::cancelled;
      break;
    case KillReason::upstream_exit:
    case KillReason::none:
      code = output.status.kind() == ExitStatus::Kind::signaled ? errc::signaled
                                                                : errc::exit_failure;
      break;
  }

  return Error{.code = make_error_code(code),
               .context = "command",
               .failure = CommandFailure{.status = output.status,
                                         .kill_reason = output.kill_reason,
                                         .stdout_data = std::move(output.stdout_data),
                                         .stderr_data = std::move(output.stderr_data)}};
}

CommandError::CommandError(Error error) : std::runtime_error(describe(error)), error_(std::move(error)) {}

namespace internal {

[[noreturn]] void throw_error(const Error& error) {
  if (error.failure) {
    throw CommandError(error);
  }
  if (error.code.category() == std::system_category()) {
    throw std::system_error(error.code, error.context);
  }
  throw std::runtime_error(describe(error));
}

}  // namespace internal

}  // namespace procvisor
