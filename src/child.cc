#include "procvisor/child.hpp"

#include "procvisor/internal/access.hpp"
#include "procvisor/internal/backend.hpp"

namespace procvisor {

struct Child::Impl {
  explicit Impl(internal::Spawned record) : spawned(record) {
    if (record.stdin_fd) {
      stdin_pipe.emplace(*record.stdin_fd);
    }
    if (record.stdout_fd) {
      stdout_pipe.emplace(*record.stdout_fd);
    }
    if (record.stderr_fd) {
      stderr_pipe.emplace(*record.stderr_fd);
    }
  }

  internal::Spawned spawned;
  std::optional<PipeWriter> stdin_pipe;
  std::optional<PipeReader> stdout_pipe;
  std::optional<PipeReader> stderr_pipe;
};

Child::Child() = default;
Child::Child(Child&& other) noexcept = default;
Child& Child::operator=(Child&& other) noexcept = default;
Child::~Child() = default;

namespace internal {

Child ChildAccess::from_spawned(Spawned spawned) {
  Child child;
  ChildAccess::impl(child) = std::make_unique<Child::Impl>(spawned);
  return child;
}

Spawned* ChildAccess::spawned(Child& child) {
  return child.impl_ ? &child.impl_->spawned : nullptr;
}

}  // namespace internal

namespace {

template <typename Pipe>
std::optional<Pipe> take(std::optional<Pipe>& slot) noexcept {
  std::optional<Pipe> pipe = std::move(slot);
  slot.reset();
  return pipe;
}

Error empty_handle(errc code, const char* context) {
  return Error{.code = make_error_code(code), .context = context};
}

}  // namespace

int Child::id() const noexcept { return impl_ ? impl_->spawned.pid : -1; }

std::optional<PipeWriter> Child::take_stdin() noexcept {
  return impl_ ? take(impl_->stdin_pipe) : std::nullopt;
}

std::optional<PipeReader> Child::take_stdout() noexcept {
  return impl_ ? take(impl_->stdout_pipe) : std::nullopt;
}

std::optional<PipeReader> Child::take_stderr() noexcept {
  return impl_ ? take(impl_->stderr_pipe) : std::nullopt;
}

Result<ExitStatus> Child::wait() {
  if (!impl_) {
    return empty_handle(errc::wait_failed, "wait");
  }
  return internal::default_backend().wait(impl_->spawned);
}

Result<std::optional<ExitStatus>> Child::try_wait() {
  if (!impl_) {
    return empty_handle(errc::wait_failed, "try_wait");
  }
  return internal::default_backend().try_wait(impl_->spawned);
}

Result<void> Child::kill() {
  if (!impl_) {
    return empty_handle(errc::kill_failed, "kill");
  }
  return internal::default_backend().kill(impl_->spawned);
}

}  // namespace procvisor
