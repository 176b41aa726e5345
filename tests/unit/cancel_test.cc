#include "procvisor/cancel.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

namespace procvisor {

TEST(CancelTest, SignalIsConsumedOnce) {
  auto [sender, receiver] = make_cancel_channel();
  EXPECT_FALSE(receiver.try_recv());

  EXPECT_TRUE(sender.send());
  EXPECT_TRUE(receiver.pending());
  EXPECT_TRUE(receiver.try_recv());
  EXPECT_FALSE(receiver.try_recv());
  EXPECT_FALSE(receiver.pending());
}

TEST(CancelTest, SecondSendWhilePendingIsRejected) {
  auto [sender, receiver] = make_cancel_channel();
  EXPECT_TRUE(sender.send());
  EXPECT_FALSE(sender.send());
  EXPECT_TRUE(receiver.try_recv());
  EXPECT_TRUE(sender.send());
}

TEST(CancelTest, CopiesShareOneSlot) {
  auto [sender, receiver] = make_cancel_channel();
  CancelReceiver copy = receiver;
  ASSERT_TRUE(sender.send());

  EXPECT_TRUE(copy.try_recv());
  EXPECT_FALSE(receiver.try_recv());
}

TEST(CancelTest, RecvForTimesOutWithoutSignal) {
  auto [sender, receiver] = make_cancel_channel();
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(receiver.recv_for(std::chrono::milliseconds(20)));
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
  (void)sender;
}

TEST(CancelTest, RecvForWakesOnSend) {
  auto channel = make_cancel_channel();
  CancelSender sender = channel.first;
  std::thread producer([sender] {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    sender.send();
  });

  EXPECT_TRUE(channel.second.recv_for(std::chrono::seconds(5)));
  producer.join();
  EXPECT_FALSE(channel.second.pending());
}

TEST(CancelTest, SignalsAfterLastRunAreDropped) {
  auto [sender, receiver] = make_cancel_channel();
  {
    internal::CancelScope run(receiver);
    EXPECT_TRUE(sender.send());
  }
  // The unconsumed signal ended with the run.
  EXPECT_FALSE(receiver.pending());
  EXPECT_FALSE(sender.send());
  EXPECT_FALSE(receiver.try_recv());

  internal::CancelScope next_run(receiver);
  EXPECT_TRUE(sender.send());
  EXPECT_TRUE(receiver.try_recv());
}

TEST(CancelTest, SignalBeforeFirstRunIsKept) {
  auto [sender, receiver] = make_cancel_channel();
  ASSERT_TRUE(sender.send());
  internal::CancelScope run(receiver);
  EXPECT_TRUE(receiver.try_recv());
}

TEST(CancelTest, ChannelStaysLiveWhileAnyRunIsAttached) {
  auto [sender, receiver] = make_cancel_channel();
  internal::CancelScope outer(receiver);
  {
    internal::CancelScope inner(receiver);
  }
  EXPECT_TRUE(sender.send());
  EXPECT_TRUE(receiver.pending());
}

}  // namespace procvisor
