#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

#include "procvisor/platform.hpp"
#include "procvisor/status.hpp"

#include "procvisor/internal/expected.hpp"

namespace procvisor {

/// @brief Error codes for procvisor operations.
enum class errc : std::uint8_t {
  /// @brief No error.
  ok = 0,

  // Configuration / API misuse
  /// @brief Command has no program.
  empty_argv,
  /// @brief Invalid stdio configuration.
  invalid_stdio,

  // OS/syscall failures
  /// @brief Pipe creation failed.
  pipe_failed,
  /// @brief Process creation failed.
  spawn_failed,
  /// @brief Wait operation failed or produced no status.
  wait_failed,
  /// @brief Read operation failed.
  read_failed,
  /// @brief Write operation failed.
  write_failed,
  /// @brief File descriptor duplication failed.
  dup_failed,
  /// @brief Change-directory failed.
  chdir_failed,
  /// @brief Kill operation failed.
  kill_failed,
  /// @brief Monitor thread could not be started.
  thread_failed,

  // Abnormal termination of a process that did run
  /// @brief Process exited with a nonzero code or wrote to stderr.
  exit_failure,
  /// @brief Process was terminated by a signal it did not get from us.
  signaled,
  /// @brief Process was killed because its timeout elapsed.
  timeout,
  /// @brief Process was killed because cancellation was signaled.
  cancelled,
};

/// @brief Coarse classification of a failure.
enum class FailureKind : std::uint8_t {
  /// @brief API misuse (bad descriptor).
  usage,
  /// @brief The OS could not create the process.
  spawn_failure,
  /// @brief Reading, waiting or threading failed around a running process.
  io_failure,
  /// @brief The process ran and exited unsuccessfully.
  abnormal_exit,
  /// @brief The process was ended by a signal (timeout, cancel or external).
  killed,
};

/// @brief Diagnostics captured from a process that ran but did not succeed.
struct CommandFailure {
  /// @brief Exit status, if one was observed.
  std::optional<ExitStatus> status;
  /// @brief Why the supervisor killed the process, if it did.
  KillReason kill_reason = KillReason::none;
  /// @brief Captured stdout data.
  std::string stdout_data;
  /// @brief Captured stderr data.
  std::string stderr_data;
};

/// @brief Error payload returned by procvisor APIs.
struct Error {
  /// @brief Error code: procvisor category or a system errno.
  std::error_code code;
  /// @brief Human-readable context for the failure.
  std::string context;
  /// @brief Process diagnostics for abnormal terminations.
  std::optional<CommandFailure> failure;
};

/// @brief Exception thrown by *_or_throw helpers for abnormal terminations.
class CommandError : public std::runtime_error {
 public:
  explicit CommandError(Error error);

  [[nodiscard]] const Error& error() const noexcept { return error_; }
  [[nodiscard]] const CommandFailure& failure() const noexcept { return *error_.failure; }

 private:
  Error error_;
};

/// @brief procvisor error category for std::error_code.
const std::error_category& error_category() noexcept;
/// @brief Create an error_code in the procvisor category.
std::error_code make_error_code(errc value) noexcept;
/// @brief Classify an error into spawn/io/abnormal-exit/killed.
FailureKind classify(const Error& error) noexcept;

/// @brief Result type used by procvisor APIs (std::expected-like).
template <typename T>
using Result = expected<T, Error>;

/// @brief Stdout of a successful run, or an abnormal-termination error.
///
/// A run is successful when its status is success and nothing was written to
/// stderr. Otherwise the error carries the status, kill reason and both
/// captured streams; its code is timeout/cancelled for supervisor kills,
/// signaled for other signal deaths and exit_failure otherwise.
Result<std::string> into_result(Output output);

namespace internal {
/// @brief Throw an error as an exception (used by *_or_throw helpers).
[[noreturn]] void throw_error(const Error& error);
}  // namespace internal

}  // namespace procvisor

namespace std {

/// @brief Enable implicit conversion from procvisor::errc to std::error_code.
template <>
struct is_error_code_enum<procvisor::errc> : true_type {};

}  // namespace std
