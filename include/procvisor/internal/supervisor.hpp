#pragma once

#include <chrono>

#include "procvisor/command.hpp"
#include "procvisor/result.hpp"
#include "procvisor/status.hpp"

namespace procvisor::internal {

/// @brief Bounded re-check interval while the caller waits for the monitor.
inline constexpr std::chrono::milliseconds kStatusRecheckInterval{1000};

/// @brief Spawn cmd, monitor it on its own thread, drain on this one.
Result<Output> supervise(const Command& cmd);
/// @brief Spawn first | second and supervise the pair under first's settings.
Result<Output> supervise_pipe(const Command& first, const Command& second);

}  // namespace procvisor::internal
