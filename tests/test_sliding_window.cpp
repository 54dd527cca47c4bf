#include "utils/sliding_window.hpp"

#include <gtest/gtest.h>

TEST(SlidingWindowTest, PruneDropsEventsOlderThanSpan) {
  SlidingWindow window(1000);
  window.record(100);
  window.record(200);
  window.record(1100);
  window.record(1200);

  window.prune(1150);
  EXPECT_EQ(window.size(), 3u);
  EXPECT_EQ(window.oldest(), 200u);

  window.prune(2100);
  EXPECT_EQ(window.size(), 2u);
  EXPECT_EQ(window.oldest(), 1100u);

  window.prune(3000);
  EXPECT_TRUE(window.empty());
}

TEST(SlidingWindowTest, EventExactlyAtCutoffIsKept) {
  SlidingWindow window(1000);
  window.record(500);
  window.prune(1500);
  EXPECT_EQ(window.size(), 1u);
  window.prune(1501);
  EXPECT_TRUE(window.empty());
}

TEST(SlidingWindowTest, PruneBeforeFirstSpanElapsedKeepsEverything) {
  SlidingWindow window(1000);
  window.record(10);
  window.prune(900);
  EXPECT_EQ(window.size(), 1u);

  SlidingWindow empty_window(1000);
  EXPECT_NO_THROW(empty_window.prune(5000));
  EXPECT_EQ(empty_window.oldest(), 0u);
}

TEST(SlidingWindowTest, CapacityEvictsOldest) {
  SlidingWindow window(60000, 3);
  for (uint64_t ts = 1000; ts < 1005; ++ts)
    window.record(ts);

  EXPECT_EQ(window.size(), 3u);
  EXPECT_EQ(window.oldest(), 1002u);
  EXPECT_EQ(window.newest(), 1004u);
}

TEST(SlidingWindowTest, LateTimestampIsClampedToNewest) {
  SlidingWindow window(1000);
  window.record(500);
  window.record(300);

  EXPECT_EQ(window.newest(), 500u);
  window.prune(1400);
  EXPECT_EQ(window.size(), 2u);
}

TEST(SlidingWindowTest, CountSinceIncludesBoundary) {
  SlidingWindow window(10000);
  window.record(100);
  window.record(200);
  window.record(300);

  EXPECT_EQ(window.count_since(200), 2u);
  EXPECT_EQ(window.count_since(0), 3u);
  EXPECT_EQ(window.count_since(301), 0u);
}
