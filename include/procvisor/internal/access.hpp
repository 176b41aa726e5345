#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "procvisor/child.hpp"
#include "procvisor/command.hpp"

namespace procvisor::internal {

struct Spawned;

struct ChildAccess {
  static std::unique_ptr<procvisor::Child::Impl>& impl(procvisor::Child& child) {
    return child.impl_;
  }
  static procvisor::Child from_spawned(Spawned spawned);
  /// @brief The spawned record behind a child, or nullptr for an empty handle.
  static Spawned* spawned(procvisor::Child& child);
};

struct CommandAccess {
  static const std::vector<std::string>& argv(const Command& cmd) { return cmd.argv_; }
  static const std::optional<std::filesystem::path>& cwd(const Command& cmd) { return cmd.cwd_; }
  static const std::optional<Stdio>& stdin_opt(const Command& cmd) { return cmd.stdin_; }
  static const std::optional<Stdio>& stdout_opt(const Command& cmd) { return cmd.stdout_; }
  static const std::optional<Stdio>& stderr_opt(const Command& cmd) { return cmd.stderr_; }
  static const std::optional<std::chrono::milliseconds>& timeout(const Command& cmd) {
    return cmd.timeout_;
  }
  static const std::optional<CancelReceiver>& cancel(const Command& cmd) { return cmd.cancel_; }
  static std::chrono::milliseconds downstream_grace(const Command& cmd) {
    return cmd.downstream_grace_;
  }
  static bool debug(const Command& cmd) { return cmd.debug_; }
};

}  // namespace procvisor::internal
