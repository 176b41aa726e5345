#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace procvisor {

/// @brief Portable process exit status.
class ExitStatus {
 public:
  /// @brief The kind of exit status.
  enum class Kind : std::uint8_t {
    /// @brief Process exited normally with an exit code.
    exited,
    /// @brief Process was terminated by a signal.
    signaled,
    /// @brief Status could not be decoded.
    other
  };

  /// @brief Construct a normal exit status with an exit code.
  static ExitStatus exited(int code, std::uint32_t native = 0) noexcept;
  /// @brief Construct a signal termination status.
  static ExitStatus signaled(int signo, std::uint32_t native = 0) noexcept;
  /// @brief Construct an undecodable status.
  static ExitStatus other(std::uint32_t native = 0) noexcept;

  /// @brief Kind discriminator.
  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  /// @brief True if exited with code 0.
  [[nodiscard]] bool success() const noexcept { return kind_ == Kind::exited && value_ == 0; }
  /// @brief Exit code if the process exited normally.
  [[nodiscard]] std::optional<int> code() const noexcept;
  /// @brief Terminating signal if the process was signaled.
  [[nodiscard]] std::optional<int> signal() const noexcept;
  /// @brief Native OS wait status.
  [[nodiscard]] std::uint32_t native() const noexcept { return native_; }

  friend bool operator==(const ExitStatus&, const ExitStatus&) = default;

 private:
  Kind kind_{Kind::other};
  int value_{0};
  std::uint32_t native_{0};
};

/// @brief Why the supervisor killed a process.
enum class KillReason : std::uint8_t {
  /// @brief The process ended on its own.
  none,
  /// @brief The configured timeout elapsed.
  timeout,
  /// @brief The cancellation channel fired.
  cancelled,
  /// @brief Pipe consumer outlived its producer past the grace period.
  upstream_exit,
};

/// @brief Render a kill reason ("none", "timeout", ...).
const char* to_string(KillReason reason) noexcept;

/// @brief Render a status ("exit code 1", "signal 9", ...).
std::string to_string(const ExitStatus& status);

/// @brief Terminal result of a supervised run.
struct Output {
  /// @brief Exit status for the process.
  ExitStatus status;
  /// @brief Set when the supervisor's kill ended the process.
  KillReason kill_reason = KillReason::none;
  /// @brief Captured stdout data.
  std::string stdout_data;
  /// @brief Captured stderr data.
  std::string stderr_data;

  [[nodiscard]] bool success() const noexcept { return status.success(); }
  [[nodiscard]] bool has_stdout() const noexcept { return !stdout_data.empty(); }
  /// @brief True if the supervisor killed the process.
  [[nodiscard]] bool killed() const noexcept { return kill_reason != KillReason::none; }
};

}  // namespace procvisor
