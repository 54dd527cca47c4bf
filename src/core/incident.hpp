#ifndef INCIDENT_HPP
#define INCIDENT_HPP

#include "event.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct RiskScore {
  double score = 0.0; // always within [0, 1]
  Severity severity = Severity::LOW;
  std::vector<std::string> factors;
};

struct GeoLocation {
  std::string city = "Unknown";
  std::string country = "Unknown";
  double lat = 0.0;
  double lon = 0.0;
};

// Source marker used for incidents raised by the website monitors.
inline constexpr const char *WEBSITE_MONITOR_SOURCE = "WEBSITE_MONITOR";

// Merge of the primary detection with its risk score and event context.
// Enrichment produces a copy with `location` filled and `is_update` set; the
// copy keeps the original incident_id.
struct IncidentReport {
  std::string incident_id;
  uint64_t timestamp_ms = 0;
  std::string source_ip;

  Detection primary;
  RiskScore risk;
  size_t detection_count = 0;

  std::string event_type;
  std::optional<std::string> user_id;
  nlohmann::json event_data = nlohmann::json::object();

  std::optional<GeoLocation> location;
  bool is_update = false;
};

#endif // INCIDENT_HPP
