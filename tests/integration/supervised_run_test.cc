#include <gtest/gtest.h>

#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "procvisor/child.hpp"
#include "procvisor/command.hpp"
#include "procvisor/unix.hpp"
#include "tests/helpers/helper_path.hpp"

namespace procvisor {
namespace {

using std::chrono::milliseconds;
using Stopwatch = std::chrono::steady_clock;

milliseconds since(Stopwatch::time_point start) {
  return std::chrono::duration_cast<milliseconds>(Stopwatch::now() - start);
}

Command helper() {
  std::string path = support::helper_path();
  EXPECT_FALSE(path.empty()) << "procvisor_child helper not found";
  return Command(path);
}

// The supervisor must always produce a status.
void expect_determinate(const Result<Output>& result) {
  if (!result) {
    EXPECT_NE(result.error().context, "indeterminate status");
  }
}

std::filesystem::path temp_path(const std::string& name) {
  return std::filesystem::temp_directory_path() /
         (name + "-" + std::to_string(::getpid()));
}

}  // namespace

TEST(SupervisedRunTest, SuccessfulCommandReportsTrueStatus) {
  auto start = Stopwatch::now();
  auto output = Command("true").output();
  ASSERT_TRUE(output.has_value());
  EXPECT_TRUE(output->success());
  EXPECT_EQ(output->kill_reason, KillReason::none);
  EXPECT_LT(since(start), milliseconds(2000));
}

TEST(SupervisedRunTest, NonZeroExitCodeIsReported) {
  auto output = Command("sh").args({"-c", "exit 3"}).output();
  ASSERT_TRUE(output.has_value());
  EXPECT_EQ(output->status.code(), 3);
  EXPECT_FALSE(output->killed());

  auto as_result = into_result(*output);
  ASSERT_FALSE(as_result.has_value());
  EXPECT_EQ(classify(as_result.error()), FailureKind::abnormal_exit);
}

TEST(SupervisedRunTest, CapturesBothStreamsSeparately) {
  auto output = helper().args({"--stdout-text", "out\nlast", "--stderr-text", "err"}).output();
  ASSERT_TRUE(output.has_value());
  EXPECT_EQ(output->stdout_data, "out\nlast");
  EXPECT_EQ(output->stderr_data, "err");

  auto as_result = into_result(*output);
  ASSERT_FALSE(as_result.has_value());
  EXPECT_EQ(as_result.error().failure->stderr_data, "err");
}

TEST(SupervisedRunTest, SuccessfulQuietRunConvertsToStdout) {
  auto output = Command("printf").arg("hello").output();
  ASSERT_TRUE(output.has_value());
  auto text = into_result(*output);
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(text.value(), "hello");
}

TEST(SupervisedRunTest, LargeOutputOnBothStreamsDoesNotStall) {
  constexpr std::size_t kBytes = 2 * 1024 * 1024;
  auto output = helper()
                    .args({"--stdout-bytes", std::to_string(kBytes), "--stderr-bytes",
                           std::to_string(kBytes)})
                    .timeout(milliseconds(30000))
                    .output();
  ASSERT_TRUE(output.has_value());
  EXPECT_TRUE(output->success());
  EXPECT_EQ(output->stdout_data.size(), kBytes);
  EXPECT_EQ(output->stderr_data.size(), kBytes);
}

TEST(SupervisedRunTest, TimeoutKillsLongRunningChild) {
  auto start = Stopwatch::now();
  auto output = Command("sleep").arg("1").timeout(milliseconds(100)).output();
  auto elapsed = since(start);

  expect_determinate(output);
  ASSERT_TRUE(output.has_value());
  EXPECT_EQ(output->kill_reason, KillReason::timeout);
  EXPECT_TRUE(unix::was_killed(output->status));
  EXPECT_GE(elapsed, milliseconds(100));
  EXPECT_LT(elapsed, milliseconds(800));

  auto as_result = into_result(*output);
  ASSERT_FALSE(as_result.has_value());
  EXPECT_EQ(as_result.error().code, make_error_code(errc::timeout));
  EXPECT_EQ(classify(as_result.error()), FailureKind::killed);
}

TEST(SupervisedRunTest, CancellationKillsChild) {
  auto [sender, receiver] = make_cancel_channel();
  std::thread canceller([sender = sender] {
    std::this_thread::sleep_for(milliseconds(150));
    sender.send();
  });

  auto start = Stopwatch::now();
  auto output = Command("sleep").arg("5").cancel_on(receiver).output();
  auto elapsed = since(start);
  canceller.join();

  expect_determinate(output);
  ASSERT_TRUE(output.has_value());
  EXPECT_EQ(output->kill_reason, KillReason::cancelled);
  EXPECT_TRUE(unix::was_killed(output->status));
  EXPECT_GE(elapsed, milliseconds(150));
  EXPECT_LT(elapsed, milliseconds(1500));
}

TEST(SupervisedRunTest, ConcurrentRunsOverlap) {
  constexpr int kRuns = 6;
  std::vector<std::thread> workers;
  std::vector<int> codes(kRuns, -1);

  auto start = Stopwatch::now();
  for (int i = 0; i < kRuns; ++i) {
    workers.emplace_back([&codes, i] {
      auto output = Command("sleep").arg("0.3").output();
      if (output && output->status.code()) {
        codes[static_cast<std::size_t>(i)] = *output->status.code();
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }
  auto elapsed = since(start);

  for (int code : codes) {
    EXPECT_EQ(code, 0);
  }
  EXPECT_LT(elapsed, milliseconds(300 * kRuns / 2));
}

TEST(SupervisedRunTest, PipeTransformsBytesExactly) {
  auto output = Command("printf").arg("a\\nb\\nc").pipe(Command("sed").arg("s/b/B/"));
  expect_determinate(output);
  ASSERT_TRUE(output.has_value());
  EXPECT_TRUE(output->success());
  EXPECT_EQ(output->stdout_data, "a\nB\nc");
  EXPECT_TRUE(output->stderr_data.empty());
}

TEST(SupervisedRunTest, PipeCarriesLargePayload) {
  constexpr std::size_t kBytes = 1024 * 1024;
  auto output = helper()
                    .args({"--stdout-bytes", std::to_string(kBytes)})
                    .pipe(helper().arg("--echo-stdin"));
  ASSERT_TRUE(output.has_value());
  EXPECT_TRUE(output->success());
  EXPECT_EQ(output->stdout_data, std::string(kBytes, 'a'));
}

TEST(SupervisedRunTest, NaturalExitBeforeTimeoutIsNotAKill) {
  for (int i = 0; i < 20; ++i) {
    auto output = Command("true").timeout(milliseconds(5000)).output();
    ASSERT_TRUE(output.has_value());
    EXPECT_TRUE(output->success());
    EXPECT_EQ(output->kill_reason, KillReason::none);
  }
}

TEST(SupervisedRunTest, CancellationAfterRunDoesNotReachNextRun) {
  auto channel = make_cancel_channel();
  CancelSender sender = channel.first;
  Command cmd = Command("sleep").arg("0.3").cancel_on(channel.second);

  auto first = cmd.output();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->kill_reason, KillReason::none);

  EXPECT_FALSE(sender.send());
  EXPECT_FALSE(channel.second.pending());

  auto start = Stopwatch::now();
  auto second = cmd.output();
  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(second->success());
  EXPECT_EQ(second->kill_reason, KillReason::none);
  EXPECT_GE(since(start), milliseconds(250));

  // A signal sent while a run is active still cancels it.
  std::thread canceller([sender] {
    std::this_thread::sleep_for(milliseconds(100));
    sender.send();
  });
  auto third = cmd.output();
  canceller.join();
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(third->kill_reason, KillReason::cancelled);
}

TEST(SupervisedRunTest, ExternallySignaledChildIsNotSupervisorKill) {
  auto output = helper().args({"--raise", std::to_string(SIGTERM)}).output();
  ASSERT_TRUE(output.has_value());
  EXPECT_EQ(output->status.signal(), SIGTERM);
  EXPECT_EQ(output->kill_reason, KillReason::none);

  auto as_result = into_result(*output);
  ASSERT_FALSE(as_result.has_value());
  EXPECT_EQ(as_result.error().code, make_error_code(errc::signaled));
}

TEST(SupervisedRunTest, ConsumerOutlivingProducerIsKilledAfterGrace) {
  auto start = Stopwatch::now();
  auto output = Command("printf")
                    .arg("x")
                    .downstream_grace(milliseconds(100))
                    .pipe(Command("sleep").arg("5"));
  auto elapsed = since(start);

  ASSERT_TRUE(output.has_value());
  EXPECT_EQ(output->kill_reason, KillReason::upstream_exit);
  EXPECT_TRUE(unix::was_killed(output->status));
  EXPECT_LT(elapsed, milliseconds(2000));
}

TEST(SupervisedRunTest, PipeTimeoutKillsBothProcesses) {
  auto start = Stopwatch::now();
  auto output = Command("sleep").arg("5").timeout(milliseconds(100)).pipe(Command("cat"));
  auto elapsed = since(start);

  ASSERT_TRUE(output.has_value());
  EXPECT_EQ(output->kill_reason, KillReason::timeout);
  EXPECT_LT(elapsed, milliseconds(2000));
}

TEST(SupervisedRunTest, EarlyConsumerExitEndsPipe) {
  auto start = Stopwatch::now();
  auto output = Command("sleep").arg("5").pipe(Command("true"));
  auto elapsed = since(start);

  ASSERT_TRUE(output.has_value());
  EXPECT_TRUE(output->success());
  EXPECT_EQ(output->kill_reason, KillReason::none);
  EXPECT_LT(elapsed, milliseconds(2000));
}

TEST(SupervisedRunTest, MissingProgramIsSpawnFailure) {
  auto output = Command("/definitely/not/a/program").output();
  ASSERT_FALSE(output.has_value());
  EXPECT_EQ(classify(output.error()), FailureKind::spawn_failure);
  EXPECT_EQ(output.error().code, std::error_code(ENOENT, std::system_category()));
}

TEST(SupervisedRunTest, MissingWorkingDirectoryIsSpawnFailure) {
  auto output = Command("true").current_dir("/definitely/not/a/dir").output();
  ASSERT_FALSE(output.has_value());
  EXPECT_EQ(classify(output.error()), FailureKind::spawn_failure);
  // The child reports the failed step and its errno through the error pipe.
  EXPECT_EQ(output.error().context, "spawn: chdir");
  EXPECT_EQ(output.error().code, std::error_code(ENOENT, std::system_category()));
}

TEST(SupervisedRunTest, RunsInConfiguredDirectory) {
  auto dir = std::filesystem::canonical(std::filesystem::temp_directory_path());
  auto output = helper().arg("--print-cwd").current_dir(dir).output();
  ASSERT_TRUE(output.has_value());
  EXPECT_EQ(output->stdout_data, dir.string());
}

TEST(SupervisedRunTest, PipedStdinIsClosedForOutput) {
  auto output = helper().arg("--echo-stdin").stdin(Stdio::piped()).output();
  ASSERT_TRUE(output.has_value());
  EXPECT_TRUE(output->success());
  EXPECT_TRUE(output->stdout_data.empty());
}

TEST(SupervisedRunTest, ChildSeesOnlyStandardDescriptors) {
  auto path = temp_path("procvisor-fds");
  auto output = helper().args({"--write-open-fds", path.string()}).stdin(Stdio::null()).output();
  ASSERT_TRUE(output.has_value());

  std::ifstream file(path);
  std::stringstream contents;
  contents << file.rdbuf();
  std::filesystem::remove(path);
  EXPECT_EQ(contents.str(), "0 1 2");
}

TEST(SupervisedRunTest, SpawnedChildCanBeKilledAndReaped) {
  auto child = Command("sleep").arg("5").spawn();
  ASSERT_TRUE(child.has_value());
  EXPECT_GT(child->id(), 0);

  ASSERT_TRUE(child->kill().has_value());
  auto status = child->wait();
  ASSERT_TRUE(status.has_value());
  EXPECT_TRUE(unix::was_killed(*status));

  // Killing an already reaped child is not an error.
  EXPECT_TRUE(child->kill().has_value());
}

TEST(SupervisedRunTest, SpawnedChildPipesAreUsable) {
  auto child = helper().arg("--echo-stdin").stdin(Stdio::piped()).stdout(Stdio::piped()).spawn();
  ASSERT_TRUE(child.has_value());

  auto input = child->take_stdin();
  auto echoed = child->take_stdout();
  ASSERT_TRUE(input.has_value());
  ASSERT_TRUE(echoed.has_value());
  ASSERT_TRUE(input->write_all("ping").has_value());
  input->close();

  auto text = echoed->read_all();
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(text.value(), "ping");
  auto status = child->wait();
  ASSERT_TRUE(status.has_value());
  EXPECT_TRUE(status->success());
}

TEST(SupervisedRunTest, RunReturnsWithoutWaiting) {
  auto start = Stopwatch::now();
  auto status = Command("sleep").arg("1").run();
  ASSERT_TRUE(status.has_value());
  EXPECT_FALSE(status->has_value());
  EXPECT_LT(since(start), milliseconds(500));
}

TEST(SupervisedRunTest, OutputOrThrowRaisesOnlyForRunFailures) {
  EXPECT_THROW((void)Command("/definitely/not/a/program").output_or_throw(), std::system_error);
  EXPECT_NO_THROW((void)Command("false").output_or_throw());
}

}  // namespace procvisor
