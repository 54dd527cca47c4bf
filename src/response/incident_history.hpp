#ifndef INCIDENT_HISTORY_HPP
#define INCIDENT_HISTORY_HPP

#include "core/incident.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

// Recent incidents kept in memory for /analytics. Oldest entries are dropped
// once a list reaches its capacity.
class IncidentHistory {
public:
  static constexpr size_t DEFAULT_ATTACK_CAPACITY = 1000;
  static constexpr size_t DEFAULT_WEBSITE_CAPACITY = 500;

  IncidentHistory(size_t attack_capacity = DEFAULT_ATTACK_CAPACITY,
                  size_t website_capacity = DEFAULT_WEBSITE_CAPACITY)
      : attack_capacity_(attack_capacity),
        website_capacity_(website_capacity) {}

  void record_attack(const IncidentReport &report);
  void record_website_incident(const IncidentReport &report);

  size_t attack_count() const;
  size_t website_incident_count() const;
  std::vector<IncidentReport> recent_attacks(size_t limit) const;

  struct AnalyticsInputs {
    uint64_t now_ms = 0;
    size_t threat_intel_ip_count = 0;
    size_t rate_limited_ip_count = 0;
  };

  nlohmann::json build_analytics(const AnalyticsInputs &inputs) const;

  static constexpr size_t TOP_IP_LIMIT = 5;
  static constexpr uint64_t TOP_IP_WINDOW_MS = 3600 * 1000;

private:
  const size_t attack_capacity_;
  const size_t website_capacity_;

  mutable std::mutex mutex_;
  std::deque<IncidentReport> attacks_;
  std::deque<IncidentReport> website_incidents_;
};

#endif // INCIDENT_HISTORY_HPP
