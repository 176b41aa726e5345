#pragma once

#include <string>

#include "procvisor/pipe.hpp"
#include "procvisor/result.hpp"

namespace procvisor::internal {

struct DrainResult {
  std::string stdout_data;
  std::string stderr_data;
};

/// @brief Read both pipes to EOF concurrently; null pipes count as finished.
///
/// Every byte is kept, including a trailing line without a newline. Readers are
/// closed as they reach EOF.
Result<DrainResult> drain_pipes(PipeReader* stdout_pipe, PipeReader* stderr_pipe);

}  // namespace procvisor::internal
