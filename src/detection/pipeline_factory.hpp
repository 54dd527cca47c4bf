#ifndef PIPELINE_FACTORY_HPP
#define PIPELINE_FACTORY_HPP

#include "core/config.hpp"
#include "detection/detector_pipeline.hpp"
#include "io/threat_intel/intel_manager.hpp"

#include <memory>

// Builds the shipped stage list from configuration:
// threat intel, request flood, SQL injection, XSS, card testing, brute force,
// then the remote model as the breaker-guarded expensive stage when enabled.
std::unique_ptr<DetectorPipeline>
build_detector_pipeline(const Config::AppConfig &cfg,
                        std::shared_ptr<const IntelManager> intel,
                        std::shared_ptr<circuit_breaker::CircuitBreaker> breaker);

#endif // PIPELINE_FACTORY_HPP
