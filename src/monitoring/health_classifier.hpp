#ifndef HEALTH_CLASSIFIER_HPP
#define HEALTH_CLASSIFIER_HPP

#include "core/config.hpp"
#include "core/event.hpp"
#include "monitoring/health_record.hpp"

#include <optional>
#include <string>

namespace HealthClassifier {

// What one HTTP round trip looked like. status_code is empty when no
// response was received.
struct CheckObservation {
  std::optional<int> status_code;
  std::string body;
  double response_time_ms = 0.0;
  std::string transport_error;
};

HealthRecord classify(const MonitorConfig &config,
                      const CheckObservation &observation,
                      const Config::MonitoringConfig &monitoring,
                      uint64_t checked_at_ms);

// The incident a health record should raise, if any.
std::optional<Detection> finding_for(const HealthRecord &record);

} // namespace HealthClassifier

#endif // HEALTH_CLASSIFIER_HPP
