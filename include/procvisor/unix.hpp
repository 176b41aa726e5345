#pragma once

#include <optional>

#include "procvisor/status.hpp"

namespace procvisor::unix {

/// @brief Extract terminating signal from a POSIX wait status, if present.
std::optional<int> terminating_signal(const procvisor::ExitStatus& status) noexcept;
/// @brief Access raw POSIX wait status.
std::optional<int> raw_wait_status(const procvisor::ExitStatus& status) noexcept;
/// @brief True if the process died from SIGKILL.
bool was_killed(const procvisor::ExitStatus& status) noexcept;
/// @brief True if the process died from SIGINT.
bool was_interrupted(const procvisor::ExitStatus& status) noexcept;

}  // namespace procvisor::unix
