#include <iostream>

#include "procvisor/command.hpp"

int main() {
  // clang-format off
  const auto cmd = procvisor::Command{"/bin/sleep"}
                       .arg("0.1");
  // clang-format on

  // run() does not wait; a status is rarely available this early.
  auto status = cmd.run();
  if (!status) {
    std::cerr << "run failed: " << status.error().context << " " << status.error().code.message()
              << "\n";
    return 1;
  }

  if (status->has_value()) {
    std::cout << "already finished: " << procvisor::to_string(**status) << "\n";
  } else {
    std::cout << "still running\n";
  }
  return 0;
}
