#include "procvisor/pipe.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>

#include <variant>

#include "procvisor/internal/fd.hpp"

namespace procvisor {

TEST(PipeTest, WriteAllThenReadAll) {
  auto fds = internal::create_pipe();
  ASSERT_TRUE(fds.has_value());
  PipeReader reader(fds->first.release());
  PipeWriter writer(fds->second.release());

  ASSERT_TRUE(writer.write_all("hello\nworld").has_value());
  writer.close();

  auto read = reader.read_all();
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(read.value(), "hello\nworld");
}

TEST(PipeTest, PipeFdsAreCloexec) {
  auto fds = internal::create_pipe();
  ASSERT_TRUE(fds.has_value());

  for (int fd : {fds->first.get(), fds->second.get()}) {
    int flags = ::fcntl(fd, F_GETFD);
    ASSERT_NE(flags, -1);
    EXPECT_NE(flags & FD_CLOEXEC, 0);
  }
}

TEST(PipeTest, MoveTransfersOwnership) {
  auto fds = internal::create_pipe();
  ASSERT_TRUE(fds.has_value());
  PipeReader first(fds->first.release());
  const int fd = first.native_handle();

  PipeReader second(std::move(first));
  EXPECT_FALSE(first.is_open());  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(second.native_handle(), fd);
}

TEST(PipeTest, IntoStdinHandsOverDescriptor) {
  auto fds = internal::create_pipe();
  ASSERT_TRUE(fds.has_value());
  PipeReader reader(fds->first.release());
  const int fd = reader.native_handle();

  Stdio stdio = std::move(reader).into_stdin();
  EXPECT_FALSE(reader.is_open());  // NOLINT(bugprone-use-after-move)

  const auto* pipe = std::get_if<Stdio::Pipe>(&stdio.value);
  ASSERT_NE(pipe, nullptr);
  ASSERT_TRUE(pipe->reader);
  EXPECT_EQ(pipe->reader->native_handle(), fd);
}

TEST(PipeTest, ReadFromClosedReaderFails) {
  PipeReader reader;
  auto read = reader.read_all();
  ASSERT_FALSE(read.has_value());
  EXPECT_EQ(read.error().code, make_error_code(errc::invalid_stdio));
}

}  // namespace procvisor
