#include "channel.hh"

#include <thread>

#include <gtest/gtest.h>

#include "vec.hh"

using namespace portal;

namespace {

TEST(Channel, DeliversInOrder) {
  Channel<int> channel;
  EXPECT_TRUE(channel.Send(1));
  EXPECT_TRUE(channel.Send(2));
  EXPECT_EQ(channel.Receive(), 1);
  EXPECT_EQ(channel.TryReceive(), 2);
  EXPECT_FALSE(channel.TryReceive().has_value());
}

TEST(Channel, CloseDrainsQueuedValues) {
  Channel<int> channel;
  channel.Send(7);
  channel.Close();
  EXPECT_FALSE(channel.Send(8));
  EXPECT_EQ(channel.Receive(), 7);
  EXPECT_FALSE(channel.Receive().has_value());
}

TEST(Channel, ManyProducers) {
  Channel<int> channel;
  Vec<std::thread> producers;
  for (int p = 0; p < 4; ++p) {
    producers.emplace_back([&channel, p] {
      for (int i = 0; i < 100; ++i) {
        channel.Send(p * 1000 + i);
      }
    });
  }
  int last[4] = {-1, -1, -1, -1};
  for (int n = 0; n < 400; ++n) {
    auto value = channel.Receive();
    ASSERT_TRUE(value.has_value());
    int producer = *value / 1000;
    EXPECT_GT(*value % 1000, last[producer]);
    last[producer] = *value % 1000;
  }
  for (auto &t : producers) {
    t.join();
  }
}

TEST(Channel, ReceiveWakesUpOnClose) {
  Channel<int> channel;
  std::thread closer([&] { channel.Close(); });
  EXPECT_FALSE(channel.Receive().has_value());
  closer.join();
}

} // namespace
