#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <system_error>
#include <utility>

#include "procvisor/platform.hpp"
#include "procvisor/result.hpp"

namespace procvisor::internal {

/// @brief Move-only owner of a raw descriptor.
class unique_fd {
 public:
  unique_fd() = default;
  explicit unique_fd(int fd) : fd_(fd) {}
  unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
  unique_fd& operator=(unique_fd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }
  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;
  ~unique_fd() { reset(); }

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] int release() noexcept { return std::exchange(fd_, -1); }
  void reset(int fd = -1) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }
  explicit operator bool() const noexcept { return fd_ >= 0; }

 private:
  int fd_{-1};
};

inline Error errno_error(const char* context) {
  return Error{.code = std::error_code(errno, std::system_category()), .context = context};
}

inline Result<void> add_fd_flags(int fd, int get_cmd, int set_cmd, int flags, const char* context) {
  int current = ::fcntl(fd, get_cmd);
  if (current == -1 || ::fcntl(fd, set_cmd, current | flags) == -1) {
    return errno_error(context);
  }
  return {};
}

inline Result<void> set_cloexec(int fd) {
  return add_fd_flags(fd, F_GETFD, F_SETFD, FD_CLOEXEC, "fcntl(FD_CLOEXEC)");
}

inline Result<void> set_nonblocking(int fd) {
  return add_fd_flags(fd, F_GETFL, F_SETFL, O_NONBLOCK, "fcntl(O_NONBLOCK)");
}

/// @brief Create a close-on-exec pipe as {read end, write end}.
inline Result<std::pair<unique_fd, unique_fd>> create_pipe() {
  std::array<int, 2> fds{};
#if PROCVISOR_PLATFORM_LINUX
  if (::pipe2(fds.data(), O_CLOEXEC) == -1) {
    return errno_error("pipe2");
  }
  return std::make_pair(unique_fd(fds[0]), unique_fd(fds[1]));
#else
  if (::pipe(fds.data()) == -1) {
    return errno_error("pipe");
  }
  unique_fd read_end(fds[0]);
  unique_fd write_end(fds[1]);
  for (int fd : fds) {
    auto cloexec = set_cloexec(fd);
    if (!cloexec) {
      return cloexec.error();
    }
  }
  return std::make_pair(std::move(read_end), std::move(write_end));
#endif
}

}  // namespace procvisor::internal
