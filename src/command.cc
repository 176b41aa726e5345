#include "procvisor/command.hpp"

#include <utility>

#include "procvisor/internal/access.hpp"
#include "procvisor/internal/backend.hpp"
#include "procvisor/internal/log.hpp"
#include "procvisor/internal/lowering.hpp"
#include "procvisor/internal/supervisor.hpp"

namespace procvisor {

namespace {

template <typename T>
T value_or_throw(Result<T> result) {
  if (!result) {
    internal::throw_error(result.error());
  }
  return std::move(result).value();
}

}  // namespace

Command::Command(std::string program) { argv_.push_back(std::move(program)); }

Command& Command::arg(std::string value) {
  argv_.push_back(std::move(value));
  return *this;
}

Command& Command::arg(const char* value) { return arg(std::string(value)); }

Command& Command::arg(std::string_view value) { return arg(std::string(value)); }

Command& Command::args(std::initializer_list<std::string_view> values) {
  for (auto value : values) {
    argv_.emplace_back(value);
  }
  return *this;
}

Command& Command::args(const std::vector<std::string>& values) {
  argv_.insert(argv_.end(), values.begin(), values.end());
  return *this;
}

Command& Command::current_dir(std::filesystem::path path) {
  cwd_ = std::move(path);
  return *this;
}

Command& Command::stdin(Stdio value) {
  stdin_ = std::move(value);
  return *this;
}

Command& Command::stdout(Stdio value) {
  stdout_ = std::move(value);
  return *this;
}

Command& Command::stderr(Stdio value) {
  stderr_ = std::move(value);
  return *this;
}

Command& Command::timeout(std::chrono::milliseconds value) {
  timeout_ = value;
  return *this;
}

Command& Command::cancel_on(CancelReceiver receiver) {
  cancel_ = std::move(receiver);
  return *this;
}

Command& Command::downstream_grace(std::chrono::milliseconds value) {
  downstream_grace_ = value;
  return *this;
}

Command& Command::debug(bool enabled) {
  debug_ = enabled;
  return *this;
}

std::string Command::display() const {
  std::string rendered;
  for (const auto& part : argv_) {
    if (!rendered.empty()) {
      rendered.push_back(' ');
    }
    rendered += part;
  }
  return rendered;
}

Result<Child> Command::spawn() const {
  if (debug_) {
    internal::log(internal::LogLevel::debug, "Executing `", display(), "`...");
  }
  auto lowered = internal::lower_command(*this, internal::SpawnMode::spawn, nullptr);
  if (!lowered) {
    return lowered.error();
  }
  auto spawned = internal::default_backend().spawn(lowered.value());
  if (!spawned) {
    return spawned.error();
  }
  return internal::ChildAccess::from_spawned(std::move(spawned.value()));
}

Result<std::optional<ExitStatus>> Command::run() const {
  auto child = spawn();
  if (!child) {
    return child.error();
  }
  return child->try_wait();
}

Result<Output> Command::output() const { return internal::supervise(*this); }

Result<Output> Command::pipe(const Command& next) const {
  return internal::supervise_pipe(*this, next);
}

Child Command::spawn_or_throw() const { return value_or_throw(spawn()); }

Output Command::output_or_throw() const { return value_or_throw(output()); }

Output Command::pipe_or_throw(const Command& next) const { return value_or_throw(pipe(next)); }

}  // namespace procvisor
