#include "procvisor/status.hpp"

namespace procvisor {

ExitStatus ExitStatus::exited(
    int code, std::uint32_t native) noexcept {  // NOLINT(bugprone-easily-swappable-parameters)
  ExitStatus status;
  status.kind_ = Kind::exited;
  status.value_ = code;
  status.native_ = native;
  return status;
}

ExitStatus ExitStatus::signaled(
    int signo, std::uint32_t native) noexcept {  // NOLINT(bugprone-easily-swappable-parameters)
  ExitStatus status;
  status.kind_ = Kind::signaled;
  status.value_ = signo;
  status.native_ = native;
  return status;
}

ExitStatus ExitStatus::other(std::uint32_t native) noexcept {
  ExitStatus status;
  status.kind_ = Kind::other;
  status.native_ = native;
  return status;
}

std::optional<int> ExitStatus::code() const noexcept {
  if (kind_ != Kind::exited) {
    return std::nullopt;
  }
  return value_;
}

std::optional<int> ExitStatus::signal() const noexcept {
  if (kind_ != Kind::signaled) {
    return std::nullopt;
  }
  return value_;
}

const char* to_string(KillReason reason) noexcept {
  switch (reason) {
    case KillReason::none:
      return "none";
    case KillReason::timeout:
      return "timeout";
    case KillReason::cancelled:
      return "cancelled";
    case KillReason::upstream_exit:
      return "upstream_exit";
  }
  return "unknown";
}

std::string to_string(const ExitStatus& status) {
  switch (status.kind()) {
    case ExitStatus::Kind::exited:
      return "exit code " + std::to_string(*status.code());
    case ExitStatus::Kind::signaled:
      return "signal " + std::to_string(*status.signal());
    case ExitStatus::Kind::other:
      break;
  }
  return "wait status " + std::to_string(status.native());
}

}  // namespace procvisor
