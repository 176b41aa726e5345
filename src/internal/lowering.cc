#include "procvisor/internal/lowering.hpp"

#include <variant>

#include "procvisor/internal/access.hpp"
#include "procvisor/pipe.hpp"

namespace procvisor::internal {

namespace {

enum class StdioTarget : std::uint8_t { stdin, stdout, stderr };

Error invalid_stdio(const char* context) {
  return Error{.code = make_error_code(errc::invalid_stdio), .context = context};
}

Result<StdioSpec> resolve_stdio(const std::optional<Stdio>& value, bool piped_default,
                                StdioTarget target) {
  StdioSpec spec;
  if (!value) {
    spec.kind = piped_default ? StdioSpec::Kind::piped : StdioSpec::Kind::inherit;
    return spec;
  }

  if (std::holds_alternative<Stdio::Inherit>(value->value)) {
    spec.kind = StdioSpec::Kind::inherit;
  } else if (std::holds_alternative<Stdio::Null>(value->value)) {
    spec.kind = StdioSpec::Kind::null;
  } else if (std::holds_alternative<Stdio::Piped>(value->value)) {
    spec.kind = StdioSpec::Kind::piped;
  } else if (const auto* fd = std::get_if<Stdio::Fd>(&value->value)) {
    if (fd->fd < 0) {
      return invalid_stdio("fd");
    }
    spec.kind = StdioSpec::Kind::fd;
    spec.fd = fd->fd;
  } else if (const auto* pipe = std::get_if<Stdio::Pipe>(&value->value)) {
    if (target != StdioTarget::stdin) {
      return invalid_stdio("pipe reader as output");
    }
    if (!pipe->reader || !pipe->reader->is_open()) {
      return invalid_stdio("pipe reader");
    }
    spec.kind = StdioSpec::Kind::fd;
    spec.fd = pipe->reader->native_handle();
  }
  return spec;
}

}  // namespace

Result<SpawnSpec> lower_command(const Command& cmd, SpawnMode mode,
                                const StdioOverride* override_stdio) {
  const auto& argv = CommandAccess::argv(cmd);
  if (argv.empty() || argv.front().empty()) {
    return Error{.code = make_error_code(errc::empty_argv), .context = "argv"};
  }

  SpawnSpec spec;
  spec.argv = argv;
  spec.cwd = CommandAccess::cwd(cmd);

  std::optional<Stdio> stdin_value = CommandAccess::stdin_opt(cmd);
  std::optional<Stdio> stdout_value = CommandAccess::stdout_opt(cmd);
  std::optional<Stdio> stderr_value = CommandAccess::stderr_opt(cmd);
  if (override_stdio != nullptr) {
    if (override_stdio->stdin_override) {
      stdin_value = override_stdio->stdin_override;
    }
    if (override_stdio->stdout_override) {
      stdout_value = override_stdio->stdout_override;
    }
    if (override_stdio->stderr_override) {
      stderr_value = override_stdio->stderr_override;
    }
  }

  const bool output_mode = (mode == SpawnMode::output);

  auto stdin_spec = resolve_stdio(stdin_value, false, StdioTarget::stdin);
  if (!stdin_spec) {
    return stdin_spec.error();
  }
  auto stdout_spec = resolve_stdio(stdout_value, output_mode, StdioTarget::stdout);
  if (!stdout_spec) {
    return stdout_spec.error();
  }
  auto stderr_spec = resolve_stdio(stderr_value, output_mode, StdioTarget::stderr);
  if (!stderr_spec) {
    return stderr_spec.error();
  }

  spec.stdin_spec = stdin_spec.value();
  spec.stdout_spec = stdout_spec.value();
  spec.stderr_spec = stderr_spec.value();
  return spec;
}

}  // namespace procvisor::internal
