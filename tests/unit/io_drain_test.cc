#include "procvisor/internal/io_drain.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <utility>

#include "procvisor/internal/fd.hpp"
#include "procvisor/pipe.hpp"

namespace procvisor {
namespace {

std::pair<PipeReader, PipeWriter> open_pipe() {
  auto fds = internal::create_pipe();
  EXPECT_TRUE(fds.has_value());
  return {PipeReader(fds->first.release()), PipeWriter(fds->second.release())};
}

}  // namespace

TEST(IoDrainTest, DrainsBothStreamsConcurrently) {
  auto out = open_pipe();
  auto err = open_pipe();
  PipeReader& out_reader = out.first;
  PipeWriter& out_writer = out.second;
  PipeReader& err_reader = err.first;
  PipeWriter& err_writer = err.second;

  // Larger than a pipe buffer on both streams, so draining one at a time would stall.
  std::string out_payload(256 * 1024, 'o');
  std::string err_payload(192 * 1024, 'e');

  std::atomic<bool> out_ok{false};
  std::atomic<bool> err_ok{false};
  std::thread writer_thread([&] {
    // Interleave the two streams in chunks.
    constexpr std::size_t kChunk = 16 * 1024;
    std::size_t out_pos = 0;
    std::size_t err_pos = 0;
    bool ok = true;
    while (ok && (out_pos < out_payload.size() || err_pos < err_payload.size())) {
      if (out_pos < out_payload.size()) {
        ok = out_writer.write_all(std::string_view(out_payload).substr(out_pos, kChunk)).has_value();
        out_pos += kChunk;
      }
      if (ok && err_pos < err_payload.size()) {
        ok = err_writer.write_all(std::string_view(err_payload).substr(err_pos, kChunk)).has_value();
        err_pos += kChunk;
      }
    }
    out_ok = ok;
    err_ok = ok;
    out_writer.close();
    err_writer.close();
  });

  auto drained = internal::drain_pipes(&out_reader, &err_reader);
  writer_thread.join();

  ASSERT_TRUE(drained.has_value());
  EXPECT_EQ(drained->stdout_data, out_payload);
  EXPECT_EQ(drained->stderr_data, err_payload);
  EXPECT_TRUE(out_ok);
  EXPECT_TRUE(err_ok);
  EXPECT_FALSE(out_reader.is_open());
  EXPECT_FALSE(err_reader.is_open());
}

TEST(IoDrainTest, KeepsTrailingDataWithoutNewline) {
  auto [out_reader, out_writer] = open_pipe();
  ASSERT_TRUE(out_writer.write_all("line one\nline two\npartial").has_value());
  out_writer.close();

  auto drained = internal::drain_pipes(&out_reader, nullptr);
  ASSERT_TRUE(drained.has_value());
  EXPECT_EQ(drained->stdout_data, "line one\nline two\npartial");
  EXPECT_TRUE(drained->stderr_data.empty());
}

TEST(IoDrainTest, PreservesBinaryBytes) {
  auto [err_reader, err_writer] = open_pipe();
  const std::string payload("\0\r\n\xff\x01", 5);
  ASSERT_TRUE(err_writer.write_all(payload).has_value());
  err_writer.close();

  auto drained = internal::drain_pipes(nullptr, &err_reader);
  ASSERT_TRUE(drained.has_value());
  EXPECT_TRUE(drained->stdout_data.empty());
  EXPECT_EQ(drained->stderr_data, payload);
}

TEST(IoDrainTest, ReturnsImmediatelyWithoutStreams) {
  auto drained = internal::drain_pipes(nullptr, nullptr);
  ASSERT_TRUE(drained.has_value());
  EXPECT_TRUE(drained->stdout_data.empty());
  EXPECT_TRUE(drained->stderr_data.empty());
}

TEST(IoDrainTest, ClosedReaderCountsAsFinished) {
  PipeReader closed;
  auto [err_reader, err_writer] = open_pipe();
  ASSERT_TRUE(err_writer.write_all("err").has_value());
  err_writer.close();

  auto drained = internal::drain_pipes(&closed, &err_reader);
  ASSERT_TRUE(drained.has_value());
  EXPECT_EQ(drained->stderr_data, "err");
}

TEST(IoDrainTest, ReportsReadFailure) {
  // A write end polls as an error condition and cannot be read.
  auto fds = internal::create_pipe();
  ASSERT_TRUE(fds.has_value());
  internal::unique_fd read_end = std::move(fds->first);
  PipeReader wrong_end(fds->second.release());
  read_end.reset();

  auto drained = internal::drain_pipes(&wrong_end, nullptr);
  ASSERT_FALSE(drained.has_value());
  EXPECT_EQ(drained.error().code.category(), std::system_category());
}

}  // namespace procvisor
