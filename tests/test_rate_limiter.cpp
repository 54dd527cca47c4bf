#include "response/rate_limiter.hpp"

#include <gtest/gtest.h>

class RateLimiterTest : public ::testing::Test {
protected:
  uint64_t now_ms = 1000000;

  RateLimiter make_limiter() {
    Config::RateLimitConfig cfg;
    cfg.block_duration_seconds = 300;
    cfg.score_threshold = 0.8;
    return RateLimiter(cfg, [this] { return now_ms; });
  }

  static RiskScore risk(double score, Severity severity) {
    RiskScore r;
    r.score = score;
    r.severity = severity;
    return r;
  }
};

TEST_F(RateLimiterTest, CriticalRiskBlocksForConfiguredDuration) {
  auto limiter = make_limiter();
  EXPECT_TRUE(limiter.record_high_risk("10.0.0.6", risk(1.0, Severity::CRITICAL)));
  EXPECT_TRUE(limiter.should_block("10.0.0.6"));
  EXPECT_EQ(limiter.block_expiry_ms("10.0.0.6"), now_ms + 300000);

  now_ms += 299999;
  EXPECT_TRUE(limiter.should_block("10.0.0.6"));
  now_ms += 1;
  EXPECT_FALSE(limiter.should_block("10.0.0.6"));
}

TEST_F(RateLimiterTest, ScoreAtThresholdBlocks) {
  auto limiter = make_limiter();
  EXPECT_TRUE(limiter.record_high_risk("10.0.0.7", risk(0.8, Severity::HIGH)));
  EXPECT_TRUE(limiter.should_block("10.0.0.7"));
}

TEST_F(RateLimiterTest, ModerateRiskDoesNotBlock) {
  auto limiter = make_limiter();
  EXPECT_FALSE(limiter.record_high_risk("10.0.0.5", risk(0.75, Severity::HIGH)));
  EXPECT_FALSE(limiter.should_block("10.0.0.5"));
  EXPECT_EQ(limiter.active_block_count(), 0u);
}

TEST_F(RateLimiterTest, ReblockExtendsExpiry) {
  auto limiter = make_limiter();
  limiter.record_high_risk("10.0.0.6", risk(1.0, Severity::CRITICAL));
  now_ms += 100000;
  limiter.record_high_risk("10.0.0.6", risk(1.0, Severity::CRITICAL));
  EXPECT_EQ(limiter.block_expiry_ms("10.0.0.6"), now_ms + 300000);
}

TEST_F(RateLimiterTest, ActiveBlockCountIgnoresExpiredEntries) {
  auto limiter = make_limiter();
  limiter.record_high_risk("10.0.0.1", risk(1.0, Severity::CRITICAL));
  now_ms += 200000;
  limiter.record_high_risk("10.0.0.2", risk(1.0, Severity::CRITICAL));
  EXPECT_EQ(limiter.active_block_count(), 2u);

  now_ms += 150000;
  EXPECT_EQ(limiter.active_block_count(), 1u);
  EXPECT_FALSE(limiter.should_block("10.0.0.1"));
  EXPECT_TRUE(limiter.should_block("10.0.0.2"));
}

TEST_F(RateLimiterTest, UnknownIpIsNotBlocked) {
  auto limiter = make_limiter();
  EXPECT_FALSE(limiter.should_block("192.0.2.1"));
  EXPECT_EQ(limiter.block_expiry_ms("192.0.2.1"), 0u);
}
