#include "detection/detectors/remote_model_detector.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(RemoteModelVerdictTest, BenignVerdictIsNoDetection) {
  EXPECT_FALSE(RemoteModelDetector::parse_verdict(R"({"is_threat": false})")
                   .has_value());
}

TEST(RemoteModelVerdictTest, ThreatVerdictCarriesTypeAndSeverity) {
  auto detection = RemoteModelDetector::parse_verdict(
      R"({"is_threat": true, "attack_type": "ACCOUNT_TAKEOVER",
          "severity": "HIGH", "reason": "credential stuffing"})");
  ASSERT_TRUE(detection.has_value());
  EXPECT_EQ(detection->attack_type, "ACCOUNT_TAKEOVER");
  EXPECT_EQ(detection->severity, Severity::HIGH);
  EXPECT_EQ(detection->description, "credential stuffing");
}

TEST(RemoteModelVerdictTest, GenerateEnvelopeIsUnwrapped) {
  auto detection = RemoteModelDetector::parse_verdict(
      R"({"model": "llama3", "response": "{\"is_threat\": true}", "done": true})");
  ASSERT_TRUE(detection.has_value());
  EXPECT_EQ(detection->attack_type, "AI_DETECTED_ANOMALY");
  EXPECT_EQ(detection->severity, Severity::MEDIUM);
}

TEST(RemoteModelVerdictTest, UnknownSeverityFallsBackToMedium) {
  auto detection = RemoteModelDetector::parse_verdict(
      R"({"is_threat": true, "severity": "apocalyptic"})");
  ASSERT_TRUE(detection.has_value());
  EXPECT_EQ(detection->severity, Severity::MEDIUM);
}

TEST(RemoteModelVerdictTest, UnusableAnswersThrow) {
  EXPECT_THROW(RemoteModelDetector::parse_verdict("not json"),
               std::runtime_error);
  EXPECT_THROW(RemoteModelDetector::parse_verdict(R"({"response": "maybe"})"),
               std::runtime_error);
  EXPECT_THROW(RemoteModelDetector::parse_verdict(R"({"is_threat": "yes"})"),
               std::runtime_error);
}

TEST(RemoteModelVerdictTest, PromptContainsEventContext) {
  Event event;
  event.event_type = "login";
  event.source_ip = "10.0.0.5";
  event.user_id = "alice";
  event.payload = {{"username", "alice"}};

  auto prompt = RemoteModelDetector::build_prompt(event);
  EXPECT_NE(prompt.find("is_threat"), std::string::npos);
  EXPECT_NE(prompt.find("10.0.0.5"), std::string::npos);
  EXPECT_NE(prompt.find("\"user_id\":\"alice\""), std::string::npos);
}

TEST(RemoteModelVerdictTest, InvalidEndpointIsRejected) {
  Config::RemoteModelConfig cfg;
  cfg.url = "localhost:11434";
  EXPECT_THROW(RemoteModelDetector detector(cfg), std::invalid_argument);

  cfg.url = "http://localhost:11434/api/generate";
  EXPECT_NO_THROW(RemoteModelDetector detector(cfg));
}
