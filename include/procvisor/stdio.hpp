#pragma once

#include <memory>
#include <variant>

namespace procvisor {

class PipeReader;

/// @brief Stdio configuration for a child process.
struct Stdio {
  /// @brief Inherit from parent.
  struct Inherit {};
  /// @brief Attach to the null device (discard).
  struct Null {};
  /// @brief Create a pipe and expose the parent end.
  struct Piped {};
  /// @brief Duplicate an existing file descriptor; the caller keeps ownership.
  struct Fd {
    /// @brief Native file descriptor to duplicate.
    int fd;
  };
  /// @brief Read end of another process's output, owned by this configuration.
  struct Pipe {
    /// @brief Shared so that Stdio stays copyable; the fd closes with the last owner.
    std::shared_ptr<PipeReader> reader;
  };

  /// @brief Variant holding the stdio selection.
  std::variant<Inherit, Null, Piped, Fd, Pipe> value;

  /// @brief Inherit the parent's stream.
  static Stdio inherit() { return Stdio{Inherit{}}; }
  /// @brief Redirect to null.
  static Stdio null() { return Stdio{Null{}}; }
  /// @brief Create a pipe.
  static Stdio piped() { return Stdio{Piped{}}; }
  /// @brief Duplicate a file descriptor the caller keeps open.
  static Stdio fd(int fd) { return Stdio{Fd{fd}}; }
  /// @brief Take ownership of a pipe read end (usable as stdin only).
  static Stdio from_pipe(PipeReader reader);
};

}  // namespace procvisor
