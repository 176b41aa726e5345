#include "procvisor/unix.hpp"

#include <sys/wait.h>

#include <csignal>

namespace procvisor::unix {

std::optional<int> terminating_signal(const procvisor::ExitStatus& status) noexcept {
  int raw = static_cast<int>(status.native());
  if (WIFSIGNALED(raw)) {
    return WTERMSIG(raw);
  }
  return status.signal();
}

std::optional<int> raw_wait_status(const procvisor::ExitStatus& status) noexcept {
  return static_cast<int>(status.native());
}

bool was_killed(const procvisor::ExitStatus& status) noexcept {
  return terminating_signal(status) == SIGKILL;
}

bool was_interrupted(const procvisor::ExitStatus& status) noexcept {
  return terminating_signal(status) == SIGINT;
}

}  // namespace procvisor::unix
