#include "analytics/sample_buffer.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace analytics;

TEST(SampleBufferTest, ZeroThresholdIsRejected) {
  EXPECT_THROW(SampleBuffer(0), std::invalid_argument);
}

TEST(SampleBufferTest, AppendAndDrain) {
  SampleBuffer buffer(100);
  buffer.append("cpu:", {1.0, 10});
  buffer.append("cpu:", {2.0, 20});
  buffer.append("mem:", {3.0, 30});

  EXPECT_EQ(buffer.pending_count("cpu:"), 2u);
  EXPECT_EQ(buffer.total_pending(), 3u);

  auto drained = buffer.drain("cpu:");
  ASSERT_EQ(drained.size(), 2u);
  EXPECT_DOUBLE_EQ(drained[0].value, 1.0);
  EXPECT_DOUBLE_EQ(drained[1].value, 2.0);

  EXPECT_EQ(buffer.pending_count("cpu:"), 0u);
  EXPECT_TRUE(buffer.drain("cpu:").empty());
  EXPECT_TRUE(buffer.drain("unknown:").empty());
}

TEST(SampleBufferTest, OverflowSignalledOncePerDrainCycle) {
  SampleBuffer buffer(3);
  EXPECT_FALSE(buffer.append("k:", {1, 1}).overflowed);
  EXPECT_FALSE(buffer.append("k:", {2, 2}).overflowed);

  auto third = buffer.append("k:", {3, 3});
  EXPECT_TRUE(third.overflowed);
  EXPECT_EQ(third.length, 3u);

  EXPECT_FALSE(buffer.append("k:", {4, 4}).overflowed);

  EXPECT_EQ(buffer.drain("k:").size(), 4u);
  buffer.append("k:", {5, 5});
  buffer.append("k:", {6, 6});
  EXPECT_TRUE(buffer.append("k:", {7, 7}).overflowed);
}

TEST(SampleBufferTest, KeysWithPending) {
  SampleBuffer buffer(10);
  buffer.append("a:", {1, 1});
  buffer.append("b:", {1, 1});
  buffer.drain("a:");

  auto all = buffer.keys();
  std::sort(all.begin(), all.end());
  EXPECT_EQ(all, (std::vector<std::string>{"a:", "b:"}));
  EXPECT_EQ(buffer.keys_with_pending(), (std::vector<std::string>{"b:"}));
}

TEST(SampleBufferTest, ConcurrentAppendsAreNotLost) {
  SampleBuffer buffer(1000000);
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&buffer, t] {
      std::string own_key = "own" + std::to_string(t) + ":";
      for (int i = 0; i < 1000; ++i) {
        buffer.append("shared:", {static_cast<double>(i), 0});
        buffer.append(own_key, {static_cast<double>(i), 0});
      }
    });
  }
  for (auto &writer : writers)
    writer.join();

  EXPECT_EQ(buffer.pending_count("shared:"), 4000u);
  EXPECT_EQ(buffer.total_pending(), 8000u);
}
