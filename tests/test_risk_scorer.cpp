#include "detection/risk_scorer.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

class RiskScorerTest : public ::testing::Test {
protected:
  RiskScorer scorer{Config::RiskScoringConfig{}};
  Event event;

  void SetUp() override {
    event.event_type = "login";
    event.source_ip = "10.0.0.5";
  }

  static Detection detection(const std::string &type, Severity severity) {
    Detection d;
    d.attack_type = type;
    d.severity = severity;
    return d;
  }
};

TEST_F(RiskScorerTest, SingleDetectionUsesItsSeverityWeight) {
  auto risk =
      scorer.score(event, {detection("SQL_INJECTION", Severity::HIGH)});

  EXPECT_DOUBLE_EQ(risk.score, 0.75);
  EXPECT_EQ(risk.severity, Severity::HIGH);
  ASSERT_EQ(risk.factors.size(), 1u);
  EXPECT_EQ(risk.factors[0], "SQL_INJECTION (HIGH)");
}

TEST_F(RiskScorerTest, CorrelatedDetectionsAddBonusAndFactor) {
  auto risk = scorer.score(event, {detection("XSS", Severity::MEDIUM),
                                   detection("SQL_INJECTION", Severity::HIGH)});

  EXPECT_NEAR(risk.score, 0.80, 1e-9);
  EXPECT_EQ(risk.severity, Severity::HIGH);
  ASSERT_EQ(risk.factors.size(), 3u);
  EXPECT_EQ(risk.factors[0], "XSS (MEDIUM)");
  EXPECT_EQ(risk.factors[1], "SQL_INJECTION (HIGH)");
  EXPECT_EQ(risk.factors[2], "Correlated detections: 2");
}

TEST_F(RiskScorerTest, HighCombinedScoreEscalatesToCritical) {
  std::vector<Detection> detections(6, detection("BRUTE_FORCE", Severity::HIGH));
  auto risk = scorer.score(event, detections);

  EXPECT_DOUBLE_EQ(risk.score, 1.0);
  EXPECT_EQ(risk.severity, Severity::CRITICAL);
  EXPECT_EQ(risk.factors.back(), "Escalated to CRITICAL by combined score");
}

TEST_F(RiskScorerTest, ScoreIsCappedAtOne) {
  std::vector<Detection> detections = {
      detection("CARD_TESTING", Severity::CRITICAL),
      detection("REQUEST_FLOOD", Severity::MEDIUM),
      detection("THREAT_INTEL_MATCH", Severity::HIGH)};
  auto risk = scorer.score(event, detections);

  EXPECT_DOUBLE_EQ(risk.score, 1.0);
  EXPECT_EQ(risk.severity, Severity::CRITICAL);
  // Already critical, so no escalation factor
  EXPECT_EQ(risk.factors.back(), "Correlated detections: 3");
}

TEST_F(RiskScorerTest, PrimaryIsFirstHighestSeverity) {
  std::vector<Detection> detections = {
      detection("REQUEST_FLOOD", Severity::MEDIUM),
      detection("SQL_INJECTION", Severity::HIGH),
      detection("XSS", Severity::HIGH)};
  EXPECT_EQ(scorer.primary_index(detections), 1u);
}

TEST_F(RiskScorerTest, EmptyDetectionsAreRejected) {
  EXPECT_THROW(scorer.score(event, {}), std::invalid_argument);
}
