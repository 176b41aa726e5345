#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "procvisor/result.hpp"
#include "procvisor/status.hpp"

namespace procvisor::internal {

/// @brief Resolved redirection for one standard stream.
struct StdioSpec {
  enum class Kind : std::uint8_t { inherit, null, piped, fd };
  Kind kind = Kind::inherit;
  /// @brief Descriptor to duplicate for Kind::fd.
  int fd = -1;
};

/// @brief Fully resolved spawn request.
struct SpawnSpec {
  std::vector<std::string> argv;
  std::optional<std::filesystem::path> cwd;
  StdioSpec stdin_spec;
  StdioSpec stdout_spec;
  StdioSpec stderr_spec;
};

/// @brief A spawned process and the parent ends of its piped streams.
struct Spawned {
  int pid = -1;
  /// @brief Set once the process has been reaped; the pid may be reused after that.
  std::optional<ExitStatus> exit_status;
  std::optional<int> stdin_fd;
  std::optional<int> stdout_fd;
  std::optional<int> stderr_fd;
};

/// @brief OS operations on child processes; replaceable for tests.
class Backend {
 public:
  virtual ~Backend() = default;

  virtual Result<Spawned> spawn(const SpawnSpec& spec) = 0;
  /// @brief Block until the process exits and reap it.
  virtual Result<ExitStatus> wait(Spawned& spawned) = 0;
  /// @brief Reap the process if it exited; empty while running.
  virtual Result<std::optional<ExitStatus>> try_wait(Spawned& spawned) = 0;
  /// @brief SIGKILL the process; a process that is already gone is not an error.
  virtual Result<void> kill(Spawned& spawned) = 0;
};

/// @brief Install a backend for the lifetime of this object.
class ScopedBackendOverride {
 public:
  explicit ScopedBackendOverride(Backend& backend);
  ~ScopedBackendOverride();
  ScopedBackendOverride(const ScopedBackendOverride&) = delete;
  ScopedBackendOverride& operator=(const ScopedBackendOverride&) = delete;

 private:
  Backend* previous_ = nullptr;
};

/// @brief The overriding backend if one is installed, else the POSIX backend.
Backend& default_backend();

}  // namespace procvisor::internal
