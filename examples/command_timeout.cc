#include <chrono>
#include <iostream>

#include "procvisor/command.hpp"
#include "procvisor/unix.hpp"

int main() {
  // clang-format off
  const auto cmd = procvisor::Command{"/bin/sleep"}
                       .arg("1")
                       .timeout(std::chrono::milliseconds(100));
  // clang-format on

  auto out = cmd.output();
  if (!out) {
    std::cerr << "output failed: " << out.error().context << " " << out.error().code.message()
              << "\n";
    return 1;
  }

  if (out->kill_reason != procvisor::KillReason::timeout || !procvisor::unix::was_killed(out->status)) {
    std::cerr << "expected a timeout kill, got " << procvisor::to_string(out->status) << "\n";
    return 1;
  }

  return 0;
}
