#include "health_record.hpp"

std::string health_status_to_string(HealthStatus status) {
  switch (status) {
  case HealthStatus::UP:
    return "up";
  case HealthStatus::DEGRADED:
    return "degraded";
  case HealthStatus::DOWN:
    return "down";
  case HealthStatus::ERROR:
    return "error";
  }
  return "unknown";
}
