#include "detection/detector_pipeline.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

namespace {

// Scripted stage: returns a fixed detection (or nothing) and counts calls.
class FakeDetector : public IDetector {
public:
  FakeDetector(std::string name, std::optional<Detection> result,
               int &calls, bool throws = false)
      : name_(std::move(name)), result_(std::move(result)), calls_(calls),
        throws_(throws) {}

  std::optional<Detection> classify(const Event &) override {
    ++calls_;
    if (throws_)
      throw std::runtime_error(name_ + " exploded");
    return result_;
  }
  const char *get_name() const override { return name_.c_str(); }

private:
  std::string name_;
  std::optional<Detection> result_;
  int &calls_;
  bool throws_;
};

Detection make_detection(const std::string &type, Severity severity) {
  Detection d;
  d.attack_type = type;
  d.severity = severity;
  return d;
}

} // namespace

class DetectorPipelineTest : public ::testing::Test {
protected:
  Event event;
  int first_calls = 0;
  int second_calls = 0;
  int third_calls = 0;
  int expensive_calls = 0;

  std::shared_ptr<circuit_breaker::CircuitBreaker> breaker =
      std::make_shared<circuit_breaker::CircuitBreaker>("test");

  void SetUp() override {
    event.event_type = "payment_failure";
    event.source_ip = "10.0.0.6";
  }
};

TEST_F(DetectorPipelineTest, NoDetectionsMeansNoThreat) {
  std::vector<std::unique_ptr<IDetector>> stages;
  stages.push_back(
      std::make_unique<FakeDetector>("a", std::nullopt, first_calls));
  DetectorPipeline pipeline(std::move(stages), nullptr, nullptr);

  EXPECT_TRUE(pipeline.evaluate(event).empty());
  EXPECT_EQ(first_calls, 1);
}

TEST_F(DetectorPipelineTest, CriticalDetectionStopsLaterStagesAndExpensiveStage) {
  std::vector<std::unique_ptr<IDetector>> stages;
  stages.push_back(std::make_unique<FakeDetector>(
      "a", make_detection("REQUEST_FLOOD", Severity::MEDIUM), first_calls));
  stages.push_back(std::make_unique<FakeDetector>(
      "b", make_detection("CARD_TESTING", Severity::CRITICAL), second_calls));
  stages.push_back(std::make_unique<FakeDetector>(
      "c", make_detection("XSS", Severity::HIGH), third_calls));
  auto expensive = std::make_unique<FakeDetector>(
      "model", make_detection("AI_DETECTED_ANOMALY", Severity::LOW),
      expensive_calls);

  DetectorPipeline pipeline(std::move(stages), std::move(expensive), breaker);
  auto detections = pipeline.evaluate(event);

  ASSERT_EQ(detections.size(), 2u);
  EXPECT_EQ(detections[0].attack_type, "REQUEST_FLOOD");
  EXPECT_EQ(detections[1].attack_type, "CARD_TESTING");
  EXPECT_EQ(third_calls, 0);
  EXPECT_EQ(expensive_calls, 0);
}

TEST_F(DetectorPipelineTest, ExpensiveStageRunsWhenNothingCritical) {
  std::vector<std::unique_ptr<IDetector>> stages;
  stages.push_back(std::make_unique<FakeDetector>(
      "a", make_detection("SQL_INJECTION", Severity::HIGH), first_calls));
  auto expensive = std::make_unique<FakeDetector>(
      "model", make_detection("AI_DETECTED_ANOMALY", Severity::MEDIUM),
      expensive_calls);

  DetectorPipeline pipeline(std::move(stages), std::move(expensive), breaker);
  auto detections = pipeline.evaluate(event);

  ASSERT_EQ(detections.size(), 2u);
  EXPECT_EQ(detections[1].attack_type, "AI_DETECTED_ANOMALY");
  EXPECT_EQ(expensive_calls, 1);
}

TEST_F(DetectorPipelineTest, ThrowingStageIsIsolated) {
  std::vector<std::unique_ptr<IDetector>> stages;
  stages.push_back(
      std::make_unique<FakeDetector>("broken", std::nullopt, first_calls, true));
  stages.push_back(std::make_unique<FakeDetector>(
      "b", make_detection("XSS", Severity::HIGH), second_calls));
  DetectorPipeline pipeline(std::move(stages), nullptr, nullptr);

  auto detections = pipeline.evaluate(event);
  ASSERT_EQ(detections.size(), 1u);
  EXPECT_EQ(detections[0].attack_type, "XSS");
  EXPECT_EQ(first_calls, 1);
}

TEST_F(DetectorPipelineTest, OpenBreakerSkipsExpensiveStage) {
  std::vector<std::unique_ptr<IDetector>> stages;
  auto expensive = std::make_unique<FakeDetector>("model", std::nullopt,
                                                  expensive_calls, true);
  DetectorPipeline pipeline(std::move(stages), std::move(expensive), breaker);

  for (int i = 0; i < 10; ++i)
    EXPECT_TRUE(pipeline.evaluate(event).empty());

  EXPECT_EQ(expensive_calls, 5);
  EXPECT_EQ(breaker->get_state(), circuit_breaker::State::OPEN);
}

TEST_F(DetectorPipelineTest, ExpensiveStageWithoutBreakerIsRejected) {
  std::vector<std::unique_ptr<IDetector>> stages;
  auto expensive = std::make_unique<FakeDetector>("model", std::nullopt,
                                                  expensive_calls);
  EXPECT_THROW(
      { DetectorPipeline pipeline(std::move(stages), std::move(expensive), nullptr); },
      std::invalid_argument);
}
