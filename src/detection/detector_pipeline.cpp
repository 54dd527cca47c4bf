#include "detector_pipeline.hpp"
#include "core/logger.hpp"

#include <functional>
#include <optional>
#include <stdexcept>

DetectorPipeline::DetectorPipeline(
    std::vector<std::unique_ptr<IDetector>> stages,
    std::unique_ptr<IDetector> expensive_stage,
    std::shared_ptr<circuit_breaker::CircuitBreaker> breaker)
    : stages_(std::move(stages)), expensive_stage_(std::move(expensive_stage)),
      breaker_(std::move(breaker)) {
  if (expensive_stage_ && !breaker_)
    throw std::invalid_argument(
        "An expensive detector stage requires a circuit breaker");
}

std::vector<Detection> DetectorPipeline::evaluate(const Event &event) {
  std::vector<Detection> detections;

  for (const auto &stage : stages_) {
    try {
      auto result = stage->classify(event);
      if (!result)
        continue;

      const bool critical = result->severity == Severity::CRITICAL;
      detections.push_back(std::move(*result));
      if (critical) {
        LOG(LogLevel::DEBUG, LogComponent::PIPELINE,
            "Critical detection '" << detections.back().attack_type
                                   << "' from " << stage->get_name()
                                   << ", skipping remaining stages.");
        return detections;
      }
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::PIPELINE,
          "Detector " << stage->get_name() << " failed: " << e.what());
    }
  }

  if (!expensive_stage_)
    return detections;

  IDetector &expensive = *expensive_stage_;
  auto [completed, verdict] = breaker_->execute<std::optional<Detection>>(
      [&expensive, &event]() { return expensive.classify(event); },
      std::nullopt);

  if (!completed)
    LOG(LogLevel::DEBUG, LogComponent::PIPELINE,
        "Expensive stage " << expensive.get_name()
                           << " skipped or failed, breaker status "
                           << breaker_->get_status_string());
  else if (verdict)
    detections.push_back(std::move(*verdict));

  return detections;
}
