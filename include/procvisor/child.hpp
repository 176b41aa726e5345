#pragma once

#include <memory>
#include <optional>

#include "procvisor/pipe.hpp"
#include "procvisor/result.hpp"
#include "procvisor/status.hpp"

namespace procvisor {

namespace internal {
/// @brief Internal access helper for Child.
struct ChildAccess;
}  // namespace internal

/// @brief Running child process handle.
///
/// Dropping a Child neither kills nor reaps the process.
class Child {
 public:
  Child();
  Child(Child&& other) noexcept;
  Child& operator=(Child&& other) noexcept;
  Child(const Child&) = delete;
  Child& operator=(const Child&) = delete;
  ~Child();

  /// @brief Process identifier.
  [[nodiscard]] int id() const noexcept;

  /// @brief Take ownership of stdin pipe, if present.
  std::optional<PipeWriter> take_stdin() noexcept;
  /// @brief Take ownership of stdout pipe, if present.
  std::optional<PipeReader> take_stdout() noexcept;
  /// @brief Take ownership of stderr pipe, if present.
  std::optional<PipeReader> take_stderr() noexcept;

  /// @brief Block until the child exits.
  Result<ExitStatus> wait();
  /// @brief Non-blocking wait; empty while the child is running.
  Result<std::optional<ExitStatus>> try_wait();
  /// @brief Send SIGKILL. Killing an already exited child is not an error.
  Result<void> kill();

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

  friend struct internal::ChildAccess;
};

}  // namespace procvisor
