#include <gtest/gtest.h>

#include <thread>

#include "fliprpc/progress.hpp"

using fliprpc::ProgressChannel;
using fliprpc::ProgressEvent;
using fliprpc::ProgressReporter;

TEST(ProgressTest, FullChannelCoalescesIntoNewestEvent) {
  ProgressChannel channel(2);

  EXPECT_TRUE(channel.try_send({1, 10}));
  EXPECT_TRUE(channel.try_send({2, 10}));
  EXPECT_FALSE(channel.try_send({3, 10}));
  EXPECT_FALSE(channel.try_send({4, 10}));
  EXPECT_EQ(channel.coalesced(), 2u);

  EXPECT_EQ(channel.receive()->transferred, 1u);
  EXPECT_EQ(channel.receive()->transferred, 4u);
}

TEST(ProgressTest, CloseDrainsThenEnds) {
  ProgressChannel channel;
  channel.try_send({5, std::nullopt});
  channel.close();

  EXPECT_FALSE(channel.try_send({6, std::nullopt}));
  auto last = channel.receive();
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->transferred, 5u);
  EXPECT_FALSE(last->total.has_value());
  EXPECT_FALSE(channel.receive().has_value());
}

TEST(ProgressTest, ReceiveForGivesUp) {
  ProgressChannel channel;
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(channel.receive_for(std::chrono::milliseconds(30)).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - start,
            std::chrono::milliseconds(30));
  EXPECT_FALSE(channel.closed());
}

TEST(ProgressTest, ReporterClosesOnScopeExit) {
  auto channel = std::make_shared<ProgressChannel>();
  {
    ProgressReporter reporter(channel);
    reporter.report(0, 100);
    reporter.report(100, 100);
  }
  EXPECT_TRUE(channel->closed());
}

TEST(ProgressTest, NullReporterIsHarmless) {
  ProgressReporter reporter(nullptr);
  reporter.report(1, std::nullopt);
}

TEST(ProgressTest, ConsumerSeesMonotonicProgress) {
  auto channel = std::make_shared<ProgressChannel>(4);
  std::vector<size_t> seen;

  std::thread consumer([&] {
    while (auto event = channel->receive()) seen.push_back(event->transferred);
  });
  {
    ProgressReporter reporter(channel);
    for (size_t i = 0; i <= 1000; ++i) reporter.report(i, 1000);
  }
  consumer.join();

  ASSERT_FALSE(seen.empty());
  EXPECT_EQ(seen.back(), 1000u);
  for (size_t i = 1; i < seen.size(); ++i) EXPECT_GT(seen[i], seen[i - 1]);
}
