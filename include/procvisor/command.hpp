#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "procvisor/cancel.hpp"
#include "procvisor/child.hpp"
#include "procvisor/result.hpp"
#include "procvisor/status.hpp"
#include "procvisor/stdio.hpp"

namespace procvisor {

namespace internal {
/// @brief Internal access helper for Command.
struct CommandAccess;
}  // namespace internal

/// @brief Descriptor and builder for a supervised child process.
///
/// Supervised runs (output, pipe) pipe stdout and stderr unless configured
/// otherwise; spawn and run inherit all streams by default.
class Command {
 public:
  /// @brief Default wait after a pipe producer exits before its consumer is killed.
  static constexpr std::chrono::milliseconds kDefaultDownstreamGrace{5000};

  /// @brief Construct a command with argv[0]=program.
  explicit Command(std::string program);

  /// @brief Append a single argument (owned string).
  Command& arg(std::string value);
  /// @brief Append a single argument from a C string.
  Command& arg(const char* value);
  /// @brief Append a single argument from a string view.
  Command& arg(std::string_view value);
  /// @brief Append multiple arguments from an initializer list.
  Command& args(std::initializer_list<std::string_view> values);
  /// @brief Append multiple arguments from a vector.
  Command& args(const std::vector<std::string>& values);

  /// @brief Set current working directory for the child.
  Command& current_dir(std::filesystem::path path);

  /// @brief Configure stdin.
  Command& stdin(Stdio value);
  /// @brief Configure stdout.
  Command& stdout(Stdio value);
  /// @brief Configure stderr.
  Command& stderr(Stdio value);

  /// @brief Kill the run once this much time has passed since spawn.
  Command& timeout(std::chrono::milliseconds value);
  /// @brief Kill the run when the channel behind receiver fires.
  Command& cancel_on(CancelReceiver receiver);
  /// @brief How long a pipe consumer may outlive its producer.
  Command& downstream_grace(std::chrono::milliseconds value);
  /// @brief Log each invocation at debug level (on by default).
  Command& debug(bool enabled = true);

  /// @brief Program followed by its arguments, space separated.
  [[nodiscard]] std::string display() const;

  /// @brief Spawn without supervision; the caller owns the Child.
  [[nodiscard]] Result<Child> spawn() const;
  /// @brief Spawn and return whatever status is available right away.
  [[nodiscard]] Result<std::optional<ExitStatus>> run() const;
  /// @brief Spawn, supervise, capture output and wait.
  [[nodiscard]] Result<Output> output() const;
  /// @brief Pipe this command's stdout into next and supervise both.
  ///
  /// The result describes next only. This command's timeout, cancellation
  /// and grace settings govern the pair.
  [[nodiscard]] Result<Output> pipe(const Command& next) const;

  /// @brief Spawn and throw on error.
  [[nodiscard]] Child spawn_or_throw() const;
  /// @brief Capture output and throw on error.
  [[nodiscard]] Output output_or_throw() const;
  /// @brief Pipe into next and throw on error.
  [[nodiscard]] Output pipe_or_throw(const Command& next) const;

 private:
  /// @brief Argument vector (argv[0] is the program).
  std::vector<std::string> argv_;
  std::optional<std::filesystem::path> cwd_;

  std::optional<Stdio> stdin_;
  std::optional<Stdio> stdout_;
  std::optional<Stdio> stderr_;

  std::optional<std::chrono::milliseconds> timeout_;
  std::optional<CancelReceiver> cancel_;
  std::chrono::milliseconds downstream_grace_{kDefaultDownstreamGrace};
  bool debug_ = true;

  friend struct internal::CommandAccess;
};

}  // namespace procvisor
