#ifndef DETECTOR_PIPELINE_HPP
#define DETECTOR_PIPELINE_HPP

#include "detection/detector.hpp"
#include "utils/circuit_breaker.hpp"

#include <memory>
#include <vector>

// Runs the cheap stages in order, stopping at the first CRITICAL detection.
// When nothing critical was found the expensive stage runs through the
// circuit breaker. An empty result means no threat.
class DetectorPipeline {
public:
  DetectorPipeline(std::vector<std::unique_ptr<IDetector>> stages,
                   std::unique_ptr<IDetector> expensive_stage,
                   std::shared_ptr<circuit_breaker::CircuitBreaker> breaker);

  std::vector<Detection> evaluate(const Event &event);

  size_t stage_count() const { return stages_.size(); }
  bool has_expensive_stage() const { return expensive_stage_ != nullptr; }

private:
  std::vector<std::unique_ptr<IDetector>> stages_;
  std::unique_ptr<IDetector> expensive_stage_;
  std::shared_ptr<circuit_breaker::CircuitBreaker> breaker_;
};

#endif // DETECTOR_PIPELINE_HPP
