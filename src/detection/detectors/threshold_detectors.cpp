#include "threshold_detectors.hpp"
#include "core/logger.hpp"

#include <algorithm>

namespace {

constexpr const char *CARD_FAILURE_EVENT = "payment_failure";
constexpr const char *LOGIN_FAILURE_EVENT = "login_failure";

} // namespace

CardTestingDetector::CardTestingDetector(const Config::DetectionConfig &cfg,
                                         TimeSource now)
    : threshold_(cfg.card_testing_threshold),
      window_seconds_(cfg.card_testing_window_seconds),
      counter_(cfg.card_testing_window_seconds * 1000,
               std::max(cfg.max_tracked_events_per_key,
                        cfg.card_testing_threshold),
               cfg.max_tracked_keys),
      now_(std::move(now)) {}

std::optional<Detection> CardTestingDetector::classify(const Event &event) {
  if (event.event_type != CARD_FAILURE_EVENT)
    return std::nullopt;

  size_t failures = counter_.record(event.source_ip, now_());
  if (failures < threshold_)
    return std::nullopt;

  LOG(LogLevel::INFO, LogComponent::DETECTOR,
      "Card testing pattern from " << event.source_ip << ": " << failures
                                   << " payment failures");

  Detection detection;
  detection.attack_type = "CARD_TESTING";
  detection.severity = Severity::CRITICAL;
  detection.description = "Repeated payment failures from a single source";
  detection.evidence = {{"failure_count", failures},
                        {"window_seconds", window_seconds_}};
  if (auto it = event.payload.find("card_bin");
      it != event.payload.end() && it->is_string())
    detection.evidence["card_bin"] = *it;
  return detection;
}

BruteForceDetector::BruteForceDetector(const Config::DetectionConfig &cfg,
                                       TimeSource now)
    : threshold_(cfg.brute_force_threshold),
      window_seconds_(cfg.brute_force_window_seconds),
      counter_(cfg.brute_force_window_seconds * 1000,
               std::max(cfg.max_tracked_events_per_key,
                        cfg.brute_force_threshold),
               cfg.max_tracked_keys),
      now_(std::move(now)) {}

std::optional<Detection> BruteForceDetector::classify(const Event &event) {
  if (event.event_type != LOGIN_FAILURE_EVENT)
    return std::nullopt;

  const std::string key =
      event.user_id ? "user:" + *event.user_id : "ip:" + event.source_ip;
  size_t attempts = counter_.record(key, now_());
  if (attempts < threshold_)
    return std::nullopt;

  Detection detection;
  detection.attack_type = "BRUTE_FORCE";
  detection.severity = Severity::HIGH;
  detection.description = "Repeated failed logins against one account";
  detection.evidence = {{"failed_attempts", attempts},
                        {"window_seconds", window_seconds_}};
  if (event.user_id)
    detection.evidence["target_user"] = *event.user_id;
  return detection;
}

RequestFloodDetector::RequestFloodDetector(const Config::DetectionConfig &cfg,
                                           TimeSource now)
    : max_requests_(cfg.request_flood_max_requests),
      window_seconds_(cfg.request_flood_window_seconds),
      // One slot above the limit so an exceeded window is observable
      counter_(cfg.request_flood_window_seconds * 1000,
               cfg.request_flood_max_requests + 1, cfg.max_tracked_keys),
      now_(std::move(now)) {}

std::optional<Detection> RequestFloodDetector::classify(const Event &event) {
  size_t requests = counter_.record(event.source_ip, now_());
  if (requests <= max_requests_)
    return std::nullopt;

  Detection detection;
  detection.attack_type = "REQUEST_FLOOD";
  detection.severity = Severity::MEDIUM;
  detection.description = "Event rate from a single source above the limit";
  detection.evidence = {{"requests_in_window", requests},
                        {"limit", max_requests_},
                        {"window_seconds", window_seconds_}};
  return detection;
}
