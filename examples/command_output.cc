#include <iostream>
#include <string>

#include "procvisor/command.hpp"

int main() {
  // clang-format off
  const auto cmd = procvisor::Command{"/bin/sh"}
                       .arg("-c")
                       .arg("printf 'out'; printf 'err' 1>&2");
  // clang-format on

  auto out = cmd.output();
  if (!out) {
    std::cerr << "output failed: " << out.error().context << " " << out.error().code.message()
              << "\n";
    return 1;
  }

  const auto& output = out.value();
  if (output.stdout_data != "out" || output.stderr_data != "err") {
    std::cerr << "unexpected output: stdout='" << output.stdout_data << "' stderr='"
              << output.stderr_data << "'\n";
    return 1;
  }

  // Anything on stderr turns the run into a failure.
  auto text = procvisor::into_result(output);
  if (text || procvisor::classify(text.error()) != procvisor::FailureKind::abnormal_exit) {
    std::cerr << "expected stderr output to fail the run\n";
    return 1;
  }

  return 0;
}
