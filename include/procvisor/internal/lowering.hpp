#pragma once

#include <cstdint>
#include <optional>

#include "procvisor/command.hpp"
#include "procvisor/internal/backend.hpp"
#include "procvisor/result.hpp"

namespace procvisor::internal {

/// @brief spawn: unset streams inherit. output: unset stdout/stderr are piped.
enum class SpawnMode : std::uint8_t { spawn, output };

/// @brief Per-stream replacements applied on top of the command's own settings.
struct StdioOverride {
  std::optional<Stdio> stdin_override;
  std::optional<Stdio> stdout_override;
  std::optional<Stdio> stderr_override;
};

Result<SpawnSpec> lower_command(const Command& cmd, SpawnMode mode,
                                const StdioOverride* override_stdio);

}  // namespace procvisor::internal
