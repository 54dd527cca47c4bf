#include "pipeline_factory.hpp"
#include "core/logger.hpp"
#include "detection/detectors/pattern_detector.hpp"
#include "detection/detectors/remote_model_detector.hpp"
#include "detection/detectors/threat_intel_detector.hpp"
#include "detection/detectors/threshold_detectors.hpp"
#include "utils/utils.hpp"

std::unique_ptr<DetectorPipeline>
build_detector_pipeline(const Config::AppConfig &cfg,
                        std::shared_ptr<const IntelManager> intel,
                        std::shared_ptr<circuit_breaker::CircuitBreaker> breaker) {
  const auto &det = cfg.detection;
  const TimeSource clock = &Utils::get_current_time_ms;
  std::vector<std::unique_ptr<IDetector>> stages;

  if (intel && cfg.threat_intel.enabled)
    stages.push_back(std::make_unique<ThreatIntelDetector>(intel));
  if (det.request_flood_enabled)
    stages.push_back(std::make_unique<RequestFloodDetector>(det, clock));
  if (det.signatures_enabled) {
    stages.push_back(std::make_unique<PatternDetector>(
        "sql_injection", "SQL_INJECTION", Severity::HIGH,
        "SQL injection signature in request data",
        det.sql_injection_patterns));
    stages.push_back(std::make_unique<PatternDetector>(
        "xss", "XSS", Severity::HIGH, "Cross-site scripting signature in "
                                      "request data",
        det.xss_patterns));
  }
  if (det.card_testing_enabled)
    stages.push_back(std::make_unique<CardTestingDetector>(det, clock));
  if (det.brute_force_enabled)
    stages.push_back(std::make_unique<BruteForceDetector>(det, clock));

  std::unique_ptr<IDetector> expensive;
  if (cfg.remote_model.enabled)
    expensive = std::make_unique<RemoteModelDetector>(cfg.remote_model);

  LOG(LogLevel::INFO, LogComponent::PIPELINE,
      "Detector pipeline built with " << stages.size() << " stage(s)"
                                      << (expensive ? " plus remote model"
                                                    : ""));
  return std::make_unique<DetectorPipeline>(std::move(stages),
                                            std::move(expensive),
                                            std::move(breaker));
}
