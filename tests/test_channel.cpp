#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

#include "core/channel.hpp"

using namespace ferry;

// --- ChannelTest ---

TEST(ChannelTest, PreservesOrder) {
  Channel<int> channel;
  for (int i = 0; i < 10; ++i) {
    EXPECT_TRUE(channel.send(i));
  }

  for (int i = 0; i < 10; ++i) {
    int value = -1;
    ASSERT_EQ(channel.try_recv(value), Channel<int>::RecvStatus::Ok);
    EXPECT_EQ(value, i);
  }

  int value = -1;
  EXPECT_EQ(channel.try_recv(value), Channel<int>::RecvStatus::Empty);
}

TEST(ChannelTest, CloseRejectsSends) {
  Channel<std::unique_ptr<int>> channel;
  channel.send(std::make_unique<int>(1));

  auto remaining = channel.close();
  ASSERT_EQ(remaining.size(), 1u);
  EXPECT_EQ(*remaining.front(), 1);
  EXPECT_TRUE(channel.is_closed());

  // 发送失败时消息会交还给调用者
  auto message = std::make_unique<int>(2);
  EXPECT_FALSE(channel.send(message));
  ASSERT_NE(message, nullptr);
  EXPECT_EQ(*message, 2);

  std::unique_ptr<int> out;
  EXPECT_EQ(channel.try_recv(out), Channel<std::unique_ptr<int>>::RecvStatus::Closed);
  EXPECT_FALSE(channel.recv().has_value());
}

TEST(ChannelTest, RecvBlocksUntilSend) {
  Channel<int> channel;

  std::thread producer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.send(7);
  });

  auto value = channel.recv();
  producer.join();

  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 7);
}

TEST(ChannelTest, ManyProducers) {
  Channel<int> channel;
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 1000;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        channel.send(p * kPerProducer + i);
      }
    });
  }

  // Per-producer order holds even when interleaved
  std::vector<int> last(kProducers, -1);
  for (int n = 0; n < kProducers * kPerProducer; ++n) {
    auto value = channel.recv();
    ASSERT_TRUE(value.has_value());
    int producer = *value / kPerProducer;
    EXPECT_GT(*value, last[producer]);
    last[producer] = *value;
  }

  for (auto& t : producers) {
    t.join();
  }
}
