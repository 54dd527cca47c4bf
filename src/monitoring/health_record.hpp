#ifndef HEALTH_RECORD_HPP
#define HEALTH_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class HealthStatus { UP, DEGRADED, DOWN, ERROR };

std::string health_status_to_string(HealthStatus status);

// Outcome of one check against a monitored target.
struct HealthRecord {
  std::string url;
  HealthStatus status = HealthStatus::UP;
  double response_time_ms = 0.0;
  uint64_t last_check_ms = 0;
  std::optional<int> status_code;
  std::vector<std::string> errors;
};

struct MonitorConfig {
  std::string url;
  uint32_t check_interval_seconds = 300;
  bool check_uptime = true;
  bool check_content = false;
  std::vector<std::string> expected_keywords;
  bool alert_on_performance = false;
};

#endif // HEALTH_RECORD_HPP
