#include <iostream>
#include <string>

#include "procvisor/command.hpp"

int main() {
  // clang-format off
  auto child_result = procvisor::Command{"/bin/cat"}
                          .stdin(procvisor::Stdio::piped())
                          .stdout(procvisor::Stdio::piped())
                          .spawn();
  // clang-format on
  if (!child_result) {
    std::cerr << "spawn failed: " << child_result.error().context << " "
              << child_result.error().code.message() << "\n";
    return 1;
  }

  auto& child = child_result.value();
  auto input = child.take_stdin();
  auto output = child.take_stdout();
  if (!input || !output) {
    std::cerr << "missing pipes\n";
    return 1;
  }

  if (!input->write_all("hello\n")) {
    std::cerr << "write failed\n";
    return 1;
  }
  input->close();

  auto echoed = output->read_all();
  auto status = child.wait();
  if (!echoed || !status || !status->success() || echoed.value() != "hello\n") {
    std::cerr << "unexpected result from cat\n";
    return 1;
  }

  return 0;
}
