#include "health_classifier.hpp"
#include "utils/utils.hpp"

namespace HealthClassifier {

HealthRecord classify(const MonitorConfig &config,
                      const CheckObservation &observation,
                      const Config::MonitoringConfig &monitoring,
                      uint64_t checked_at_ms) {
  HealthRecord record;
  record.url = config.url;
  record.last_check_ms = checked_at_ms;
  record.response_time_ms = observation.response_time_ms;
  record.status_code = observation.status_code;

  if (!observation.status_code) {
    record.status = HealthStatus::DOWN;
    record.errors.push_back("Connection failed: " +
                            (observation.transport_error.empty()
                                 ? std::string("no response")
                                 : observation.transport_error));
    return record;
  }

  const int code = *observation.status_code;
  if (code >= 500) {
    record.status = HealthStatus::DOWN;
    record.errors.push_back("HTTP " + std::to_string(code));
    return record;
  }

  record.status = HealthStatus::UP;
  if (code >= 400) {
    record.status = HealthStatus::DEGRADED;
    record.errors.push_back("HTTP " + std::to_string(code));
  }

  if (config.check_content && !config.expected_keywords.empty()) {
    const std::string lowered_body = Utils::to_lower_copy(observation.body);
    for (const auto &keyword : config.expected_keywords) {
      if (lowered_body.find(Utils::to_lower_copy(keyword)) ==
          std::string::npos) {
        record.status = HealthStatus::DEGRADED;
        record.errors.push_back("Missing expected keyword: " + keyword);
      }
    }
  }

  if (observation.response_time_ms > monitoring.slow_response_ms) {
    record.status = HealthStatus::DEGRADED;
    record.errors.push_back(
        "Slow response: " +
        std::to_string(static_cast<long>(observation.response_time_ms)) +
        "ms");
  }
  return record;
}

std::optional<Detection> finding_for(const HealthRecord &record) {
  Detection detection;
  detection.evidence = {{"url", record.url}, {"errors", record.errors}};
  if (record.status_code)
    detection.evidence["status_code"] = *record.status_code;

  switch (record.status) {
  case HealthStatus::UP:
    return std::nullopt;
  case HealthStatus::DOWN:
    detection.attack_type = "WEBSITE_DOWN";
    detection.severity = Severity::HIGH;
    detection.description = "Monitored website is not responding";
    break;
  case HealthStatus::DEGRADED:
    detection.attack_type = "WEBSITE_DEGRADED";
    detection.severity = Severity::MEDIUM;
    detection.description = "Monitored website is degraded";
    break;
  case HealthStatus::ERROR:
    detection.attack_type = "WEBSITE_CHECK_ERROR";
    detection.severity = Severity::LOW;
    detection.description = "Monitor check could not be completed";
    break;
  }
  return detection;
}

} // namespace HealthClassifier
