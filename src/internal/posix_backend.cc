#include <fcntl.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <string_view>

#include "procvisor/internal/backend.hpp"
#include "procvisor/internal/fd.hpp"

namespace procvisor::internal {

namespace {

constexpr int kExecFailureExitCode = 127;
constexpr long kFallbackMaxFd = 256;
constexpr const char* kDefaultSearchPath = "/usr/bin:/bin";

Error spawn_error(int error, std::string_view step) {
  std::string context = "spawn: ";
  context.append(step);
  return Error{.code = std::error_code(error, std::system_category()), .context = context};
}

// Resolve argv[0] before fork so the child only needs async-signal-safe calls.
std::string resolve_exec_path(const std::string& argv0,
                              const std::optional<std::filesystem::path>& cwd) {
  if (argv0.find('/') != std::string::npos) {
    return argv0;
  }
  const char* env_path = std::getenv("PATH");
  std::string_view search = (env_path != nullptr) ? env_path : kDefaultSearchPath;
  while (true) {
    auto end = search.find(':');
    std::string_view entry = search.substr(0, end);
    std::filesystem::path dir = entry.empty() ? std::filesystem::path(".") : std::filesystem::path(entry);
    if (cwd && dir.is_relative()) {
      dir = *cwd / dir;
    }
    std::filesystem::path candidate = dir / argv0;
    if (::access(candidate.c_str(), X_OK) == 0) {
      return candidate.string();
    }
    if (end == std::string_view::npos) {
      return argv0;
    }
    search.remove_prefix(end + 1);
  }
}

std::vector<char*> to_c_strings(std::vector<std::string>& values) {
  std::vector<char*> pointers;
  pointers.reserve(values.size() + 1);
  for (auto& value : values) {
    pointers.push_back(value.data());
  }
  pointers.push_back(nullptr);
  return pointers;
}

/// Step of child setup that failed, reported with its errno.
enum class ChildStep : int { chdir = 1, redirect, exec };

struct ChildFailure {
  ChildStep step;
  int error;
};

const char* step_name(ChildStep step) {
  switch (step) {
    case ChildStep::chdir:
      return "chdir";
    case ChildStep::redirect:
      return "dup2";
    case ChildStep::exec:
      return "exec";
  }
  return "child setup";
}

// Child side of fork: report the failed step through the error pipe and exit.
[[noreturn]] void fail_in_child(int error_fd, ChildStep step) {
  ChildFailure failure{step, errno};
  // The parent sees EOF and a short read if this fails; nothing else can be done here.
  [[maybe_unused]] ssize_t written = ::write(error_fd, &failure, sizeof(failure));
  ::_exit(kExecFailureExitCode);
}

// Child side of fork: make fd the target stream, clearing close-on-exec.
void install_stream(int fd, int target, int error_fd) {
  if (fd == target) {
    if (::fcntl(fd, F_SETFD, 0) == -1) {
      fail_in_child(error_fd, ChildStep::redirect);
    }
    return;
  }
  if (::dup2(fd, target) == -1) {
    fail_in_child(error_fd, ChildStep::redirect);
  }
}

void close_range_fallback(int first, long last_exclusive) {
  for (long fd = first; fd < last_exclusive; ++fd) {
    ::close(static_cast<int>(fd));
  }
}

// Child side of fork: drop every inherited descriptor above stderr except keep_fd.
void close_inherited_fds(int keep_fd) {
#if defined(SYS_close_range)
  if (keep_fd > STDERR_FILENO + 1 &&
      ::syscall(SYS_close_range, STDERR_FILENO + 1, keep_fd - 1, 0) != 0) {
    close_range_fallback(STDERR_FILENO + 1, keep_fd);
  }
  if (::syscall(SYS_close_range, keep_fd + 1, ~0U, 0) == 0) {
    return;
  }
#endif
  long max_fd = ::sysconf(_SC_OPEN_MAX);
  if (max_fd < 0) {
    max_fd = kFallbackMaxFd;
  }
  for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
    if (fd != keep_fd) {
      ::close(fd);
    }
  }
}

ExitStatus to_exit_status(int status) {
  if (WIFEXITED(status)) {
    return ExitStatus::exited(WEXITSTATUS(status), static_cast<std::uint32_t>(status));
  }
  if (WIFSIGNALED(status)) {
    return ExitStatus::signaled(WTERMSIG(status), static_cast<std::uint32_t>(status));
  }
  return ExitStatus::other(static_cast<std::uint32_t>(status));
}

/// Descriptors opened for one spawn; the parent ends that survive are released.
struct StreamPlan {
  std::vector<unique_fd> owned;
  int child_fd = -1;
  std::optional<int> parent_fd;
};

Result<StreamPlan> plan_stream(const StdioSpec& spec, int target) {
  const bool child_reads = (target == STDIN_FILENO);
  StreamPlan plan;
  switch (spec.kind) {
    case StdioSpec::Kind::inherit:
      plan.child_fd = target;
      return plan;
    case StdioSpec::Kind::fd:
      plan.child_fd = spec.fd;
      return plan;
    case StdioSpec::Kind::null: {
      int fd = ::open("/dev/null", (child_reads ? O_RDONLY : O_WRONLY) | O_CLOEXEC);
      if (fd == -1) {
        return spawn_error(errno, "open(/dev/null)");
      }
      plan.owned.emplace_back(fd);
      plan.child_fd = fd;
      return plan;
    }
    case StdioSpec::Kind::piped: {
      auto pipe = create_pipe();
      if (!pipe) {
        return spawn_error(pipe.error().code.value(), pipe.error().context);
      }
      auto& [read_end, write_end] = pipe.value();
      plan.child_fd = child_reads ? read_end.get() : write_end.get();
      plan.parent_fd = child_reads ? write_end.get() : read_end.get();
      plan.owned.push_back(std::move(read_end));
      plan.owned.push_back(std::move(write_end));
      return plan;
    }
  }
  return Error{.code = make_error_code(errc::invalid_stdio), .context = "stdio"};
}

// Releases the parent end so closing the plan leaves only the child's end to close.
std::optional<int> keep_parent_end(StreamPlan& plan) {
  if (!plan.parent_fd) {
    return std::nullopt;
  }
  for (auto& fd : plan.owned) {
    if (fd.get() == *plan.parent_fd) {
      return fd.release();
    }
  }
  return std::nullopt;
}

class PosixBackend final : public Backend {
 public:
  Result<Spawned> spawn(const SpawnSpec& spec) override {
    if (spec.argv.empty()) {
      return Error{.code = make_error_code(errc::empty_argv), .context = "argv"};
    }

    auto stdin_plan = plan_stream(spec.stdin_spec, STDIN_FILENO);
    if (!stdin_plan) {
      return stdin_plan.error();
    }
    auto stdout_plan = plan_stream(spec.stdout_spec, STDOUT_FILENO);
    if (!stdout_plan) {
      return stdout_plan.error();
    }
    auto stderr_plan = plan_stream(spec.stderr_spec, STDERR_FILENO);
    if (!stderr_plan) {
      return stderr_plan.error();
    }

    // Error pipe reports child setup or exec failures back to the parent.
    auto error_pipe = create_pipe();
    if (!error_pipe) {
      return spawn_error(error_pipe.error().code.value(), "pipe");
    }
    unique_fd error_read = std::move(error_pipe->first);
    unique_fd error_write = std::move(error_pipe->second);

    std::vector<std::string> argv_copy = spec.argv;
    std::vector<char*> argv_c = to_c_strings(argv_copy);
    std::string exec_path = resolve_exec_path(argv_copy.front(), spec.cwd);

    const int child_stdin = stdin_plan->child_fd;
    const int child_stdout = stdout_plan->child_fd;
    const int child_stderr = stderr_plan->child_fd;

    pid_t pid = ::fork();
    if (pid == -1) {
      return spawn_error(errno, "fork");
    }

    if (pid == 0) {
      const int error_fd = error_write.get();
      if (spec.cwd && ::chdir(spec.cwd->c_str()) == -1) {
        fail_in_child(error_fd, ChildStep::chdir);
      }
      install_stream(child_stdin, STDIN_FILENO, error_fd);
      install_stream(child_stdout, STDOUT_FILENO, error_fd);
      install_stream(child_stderr, STDERR_FILENO, error_fd);
      close_inherited_fds(error_fd);
      ::execv(exec_path.c_str(), argv_c.data());
      fail_in_child(error_fd, ChildStep::exec);
    }

    error_write.reset();
    ChildFailure failure{};
    ssize_t read_result = -1;
    do {
      read_result = ::read(error_read.get(), &failure, sizeof(failure));
    } while (read_result == -1 && errno == EINTR);

    if (read_result != 0) {
      const int read_errno = errno;
      int status = 0;
      while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
      }
      if (read_result == static_cast<ssize_t>(sizeof(failure))) {
        return spawn_error(failure.error, step_name(failure.step));
      }
      return spawn_error(read_result < 0 ? read_errno : EIO, "read(error pipe)");
    }

    Spawned spawned;
    spawned.pid = pid;
    spawned.stdin_fd = keep_parent_end(*stdin_plan);
    spawned.stdout_fd = keep_parent_end(*stdout_plan);
    spawned.stderr_fd = keep_parent_end(*stderr_plan);
    return spawned;
  }

  Result<ExitStatus> wait(Spawned& spawned) override {
    if (spawned.exit_status) {
      return *spawned.exit_status;
    }
    int status = 0;
    while (::waitpid(spawned.pid, &status, 0) == -1) {
      if (errno != EINTR) {
        return errno_error("waitpid");
      }
    }
    spawned.exit_status = to_exit_status(status);
    return *spawned.exit_status;
  }

  Result<std::optional<ExitStatus>> try_wait(Spawned& spawned) override {
    if (spawned.exit_status) {
      return spawned.exit_status;
    }
    int status = 0;
    while (true) {
      pid_t rv = ::waitpid(spawned.pid, &status, WNOHANG);
      if (rv == spawned.pid) {
        spawned.exit_status = to_exit_status(status);
        return spawned.exit_status;
      }
      if (rv == 0) {
        return std::optional<ExitStatus>();
      }
      if (errno != EINTR) {
        return errno_error("waitpid");
      }
    }
  }

  Result<void> kill(Spawned& spawned) override {
    // A reaped pid may already belong to another process.
    if (spawned.exit_status) {
      return {};
    }
    if (::kill(spawned.pid, SIGKILL) == -1 && errno != ESRCH) {
      return errno_error("kill");
    }
    return {};
  }
};

std::atomic<Backend*> g_backend_override{nullptr};

}  // namespace

ScopedBackendOverride::ScopedBackendOverride(Backend& backend)
    : previous_(g_backend_override.exchange(&backend)) {}

ScopedBackendOverride::~ScopedBackendOverride() { g_backend_override.store(previous_); }

Backend& default_backend() {
  if (auto* override_backend = g_backend_override.load()) {
    return *override_backend;
  }
  static PosixBackend backend;
  return backend;
}

}  // namespace procvisor::internal
