#include "core/config.hpp"
#include "detection/detectors/pattern_detector.hpp"
#include "detection/detectors/threat_intel_detector.hpp"
#include "detection/detectors/threshold_detectors.hpp"
#include "detection/keyed_event_counter.hpp"

#include <gtest/gtest.h>

class DetectorsTest : public ::testing::Test {
protected:
  Config::DetectionConfig cfg;
  uint64_t now_ms = 5000000;
  TimeSource clock = [this] { return now_ms; };

  static Event make_event(const std::string &type, const std::string &ip,
                          nlohmann::json data = nlohmann::json::object()) {
    Event event;
    event.event_type = type;
    event.source_ip = ip;
    event.payload = std::move(data);
    return event;
  }

  PatternDetector sqli() const {
    return PatternDetector("sql_injection", "SQL_INJECTION", Severity::HIGH,
                           "SQL injection", cfg.sql_injection_patterns);
  }
};

TEST_F(DetectorsTest, PatternMatchesNestedValuesCaseInsensitively) {
  auto detector = sqli();
  auto detection = detector.classify(make_event(
      "search", "10.0.0.1",
      {{"filters", {{"terms", {"shoes", "1 UNION SELECT password"}}}}}));

  ASSERT_TRUE(detection.has_value());
  EXPECT_EQ(detection->attack_type, "SQL_INJECTION");
  EXPECT_EQ(detection->severity, Severity::HIGH);
  EXPECT_EQ(detection->evidence["matched_patterns"][0], "union select");
}

TEST_F(DetectorsTest, PatternIgnoresCleanPayload) {
  auto detector = sqli();
  EXPECT_FALSE(detector
                   .classify(make_event("search", "10.0.0.1",
                                        {{"q", "red shoes"}, {"page", 2}}))
                   .has_value());
}

TEST_F(DetectorsTest, PatternChecksUserAgent) {
  PatternDetector xss("xss", "XSS", Severity::HIGH, "XSS", cfg.xss_patterns);
  auto event = make_event("page_view", "10.0.0.2");
  event.user_agent = "Mozilla <SCRIPT>alert(1)</script>";
  EXPECT_TRUE(xss.classify(event).has_value());
}

TEST_F(DetectorsTest, EmptyPatternListNeverMatches) {
  PatternDetector none("none", "NONE", Severity::LOW, "", {"", ""});
  EXPECT_FALSE(
      none.classify(make_event("x", "10.0.0.3", {{"a", "anything"}})).has_value());
}

TEST_F(DetectorsTest, CardTestingFiresAtThresholdWithinWindow) {
  CardTestingDetector detector(cfg, clock);
  auto failure = make_event("payment_failure", "10.0.0.6", {{"card_bin", "411111"}});

  EXPECT_FALSE(detector.classify(failure).has_value());
  now_ms += 1000;
  EXPECT_FALSE(detector.classify(failure).has_value());
  now_ms += 1000;
  auto detection = detector.classify(failure);
  ASSERT_TRUE(detection.has_value());
  EXPECT_EQ(detection->attack_type, "CARD_TESTING");
  EXPECT_EQ(detection->severity, Severity::CRITICAL);
  EXPECT_EQ(detection->evidence["failure_count"], 3);
  EXPECT_EQ(detection->evidence["card_bin"], "411111");
}

TEST_F(DetectorsTest, CardTestingForgetsFailuresOutsideWindow) {
  CardTestingDetector detector(cfg, clock);
  auto failure = make_event("payment_failure", "10.0.0.6");

  detector.classify(failure);
  detector.classify(failure);
  now_ms += cfg.card_testing_window_seconds * 1000 + 1;
  EXPECT_FALSE(detector.classify(failure).has_value());
}

TEST_F(DetectorsTest, CardTestingIgnoresOtherEventTypes) {
  CardTestingDetector detector(cfg, clock);
  for (int i = 0; i < 5; ++i)
    EXPECT_FALSE(
        detector.classify(make_event("payment", "10.0.0.6")).has_value());
}

TEST_F(DetectorsTest, BruteForceKeysOnAccountAcrossSources) {
  BruteForceDetector detector(cfg, clock);
  std::optional<Detection> last;
  for (int i = 0; i < 5; ++i) {
    auto event = make_event("login_failure", "10.0.1." + std::to_string(i));
    event.user_id = "victim";
    last = detector.classify(event);
    if (i < 4)
      EXPECT_FALSE(last.has_value());
  }
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->attack_type, "BRUTE_FORCE");
  EXPECT_EQ(last->evidence["target_user"], "victim");
  EXPECT_EQ(last->evidence["failed_attempts"], 5);
}

TEST_F(DetectorsTest, BruteForceFallsBackToSourceIp) {
  BruteForceDetector detector(cfg, clock);
  std::optional<Detection> last;
  for (int i = 0; i < 5; ++i)
    last = detector.classify(make_event("login_failure", "10.0.0.9"));
  ASSERT_TRUE(last.has_value());
  EXPECT_FALSE(last->evidence.contains("target_user"));
}

TEST_F(DetectorsTest, RequestFloodFiresAboveLimit) {
  cfg.request_flood_max_requests = 3;
  RequestFloodDetector detector(cfg, clock);
  auto event = make_event("page_view", "10.0.0.10");

  for (int i = 0; i < 3; ++i)
    EXPECT_FALSE(detector.classify(event).has_value());
  auto detection = detector.classify(event);
  ASSERT_TRUE(detection.has_value());
  EXPECT_EQ(detection->attack_type, "REQUEST_FLOOD");
  EXPECT_EQ(detection->severity, Severity::MEDIUM);
  EXPECT_EQ(detection->evidence["requests_in_window"], 4);

  // Other sources are counted separately
  EXPECT_FALSE(
      detector.classify(make_event("page_view", "10.0.0.11")).has_value());
}

TEST_F(DetectorsTest, ThreatIntelFlagsBlacklistedSource) {
  auto intel = std::make_shared<IntelManager>(std::vector<std::string>{}, 3600);
  intel->replace_blacklist({"203.0.113.7"});
  ThreatIntelDetector detector(intel);

  auto detection = detector.classify(make_event("page_view", "203.0.113.7"));
  ASSERT_TRUE(detection.has_value());
  EXPECT_EQ(detection->attack_type, "THREAT_INTEL_MATCH");
  EXPECT_EQ(detection->severity, Severity::HIGH);
  EXPECT_FALSE(
      detector.classify(make_event("page_view", "198.51.100.1")).has_value());
  EXPECT_FALSE(detector.classify(make_event("page_view", "")).has_value());
}

TEST_F(DetectorsTest, ParseFeedSkipsCommentsAndBlankLines) {
  auto ips = IntelManager::parse_feed("# feed\n203.0.113.7\n\n 198.51.100.2 \r\n");
  EXPECT_EQ(ips.size(), 2u);
  EXPECT_EQ(ips.count("203.0.113.7"), 1u);
  EXPECT_EQ(ips.count("198.51.100.2"), 1u);
}

TEST(KeyedEventCounterTest, IdleKeysAreSweptWhenTheMapFills) {
  const uint64_t window_ms = 1000;
  KeyedEventCounter counter(window_ms, 10, 4);
  for (const char *ip : {"10.0.0.1", "10.0.0.2", "10.0.0.3", "10.0.0.4"})
    counter.record(ip, 0);
  EXPECT_EQ(counter.tracked_keys(), 4u);

  // Every earlier key has aged out by now.
  EXPECT_EQ(counter.record("10.0.0.5", window_ms + 1), 1u);
  EXPECT_EQ(counter.tracked_keys(), 1u);
  EXPECT_EQ(counter.evicted_keys(), 0u);
}

TEST(KeyedEventCounterTest, LiveKeysNeverExceedTheCap) {
  KeyedEventCounter counter(60000, 10, 4);
  for (int i = 0; i < 50; ++i)
    counter.record("198.51.100." + std::to_string(i), 1000);

  EXPECT_EQ(counter.tracked_keys(), 4u);
  EXPECT_EQ(counter.evicted_keys(), 46u);
  // The newest key is always kept.
  EXPECT_EQ(counter.count("198.51.100.49", 1000), 1u);
}

TEST(KeyedEventCounterTest, RepeatedKeyDoesNotGrowTheMap) {
  KeyedEventCounter counter(60000, 10, 2);
  for (int i = 0; i < 5; ++i)
    counter.record("203.0.113.9", 1000 + i);
  EXPECT_EQ(counter.tracked_keys(), 1u);
  EXPECT_EQ(counter.count("203.0.113.9", 2000), 5u);
}
