#include <chrono>
#include <iostream>
#include <thread>

#include "procvisor/cancel.hpp"
#include "procvisor/command.hpp"

int main() {
  auto [sender, receiver] = procvisor::make_cancel_channel();

  // clang-format off
  const auto cmd = procvisor::Command{"/bin/sleep"}
                       .arg("5")
                       .cancel_on(receiver);
  // clang-format on

  std::thread canceller([sender = sender] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    sender.send();
  });
  auto out = cmd.output();
  canceller.join();

  if (!out) {
    std::cerr << "output failed: " << out.error().context << " " << out.error().code.message()
              << "\n";
    return 1;
  }
  if (out->kill_reason != procvisor::KillReason::cancelled) {
    std::cerr << "expected cancellation, got " << procvisor::to_string(out->kill_reason) << "\n";
    return 1;
  }

  return 0;
}
