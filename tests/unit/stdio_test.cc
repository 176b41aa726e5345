#include "procvisor/stdio.hpp"

#include <gtest/gtest.h>

#include "procvisor/pipe.hpp"

namespace procvisor {

TEST(StdioTest, ConstructsVariants) {
  EXPECT_TRUE(std::holds_alternative<Stdio::Inherit>(Stdio::inherit().value));
  EXPECT_TRUE(std::holds_alternative<Stdio::Null>(Stdio::null().value));
  EXPECT_TRUE(std::holds_alternative<Stdio::Piped>(Stdio::piped().value));
  EXPECT_TRUE(std::holds_alternative<Stdio::Pipe>(Stdio::from_pipe(PipeReader()).value));

  auto fd = Stdio::fd(3);
  ASSERT_TRUE(std::holds_alternative<Stdio::Fd>(fd.value));
  EXPECT_EQ(std::get<Stdio::Fd>(fd.value).fd, 3);
}

TEST(StdioTest, CopiesSharePipeReader) {
  Stdio original = Stdio::from_pipe(PipeReader());
  Stdio copy = original;
  EXPECT_EQ(std::get<Stdio::Pipe>(original.value).reader,
            std::get<Stdio::Pipe>(copy.value).reader);
}

}  // namespace procvisor
