#include <iostream>
#include <string>

#include "procvisor/command.hpp"

int main() {
  // clang-format off
  const auto producer = procvisor::Command{"printf"}
                            .arg("alpha\\nbeta\\ngamma");
  const auto consumer = procvisor::Command{"sed"}
                            .arg("s/beta/BETA/");
  // clang-format on

  auto out = producer.pipe(consumer);
  if (!out) {
    std::cerr << "pipe failed: " << out.error().context << " " << out.error().code.message()
              << "\n";
    return 1;
  }

  if (out->stdout_data != "alpha\nBETA\ngamma") {
    std::cerr << "unexpected output: '" << out->stdout_data << "'\n";
    return 1;
  }

  return 0;
}
