#include "incident_history.hpp"

#include <algorithm>
#include <map>
#include <string>

void IncidentHistory::record_attack(const IncidentReport &report) {
  std::lock_guard<std::mutex> lock(mutex_);
  attacks_.push_back(report);
  while (attacks_.size() > attack_capacity_)
    attacks_.pop_front();
}

void IncidentHistory::record_website_incident(const IncidentReport &report) {
  std::lock_guard<std::mutex> lock(mutex_);
  website_incidents_.push_back(report);
  while (website_incidents_.size() > website_capacity_)
    website_incidents_.pop_front();
}

size_t IncidentHistory::attack_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return attacks_.size();
}

size_t IncidentHistory::website_incident_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return website_incidents_.size();
}

std::vector<IncidentReport>
IncidentHistory::recent_attacks(size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = std::min(limit, attacks_.size());
  return {attacks_.end() - static_cast<std::ptrdiff_t>(count), attacks_.end()};
}

nlohmann::json
IncidentHistory::build_analytics(const AnalyticsInputs &inputs) const {
  std::map<std::string, size_t> attack_type_counts;
  std::map<std::string, size_t> website_incident_counts;
  std::map<std::string, size_t> ip_counts;
  size_t total_attacks;
  size_t total_website_incidents;

  const uint64_t hour_ago =
      inputs.now_ms > TOP_IP_WINDOW_MS ? inputs.now_ms - TOP_IP_WINDOW_MS : 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    total_attacks = attacks_.size();
    total_website_incidents = website_incidents_.size();

    for (const auto &attack : attacks_) {
      attack_type_counts[attack.primary.attack_type]++;
      if (attack.timestamp_ms > hour_ago &&
          attack.source_ip != WEBSITE_MONITOR_SOURCE)
        ip_counts[attack.source_ip]++;
    }

    for (const auto &incident : website_incidents_) {
      std::string short_type = incident.primary.attack_type;
      const std::string prefix = "WEBSITE_";
      if (short_type.rfind(prefix, 0) == 0)
        short_type.erase(0, prefix.size());
      website_incident_counts[short_type]++;
    }
  }

  std::vector<std::pair<std::string, size_t>> ranked(ip_counts.begin(),
                                                     ip_counts.end());
  std::stable_sort(
      ranked.begin(), ranked.end(),
      [](const auto &a, const auto &b) { return a.second > b.second; });
  if (ranked.size() > TOP_IP_LIMIT)
    ranked.resize(TOP_IP_LIMIT);

  nlohmann::json top_ips = nlohmann::json::object();
  for (const auto &[ip, count] : ranked)
    top_ips[ip] = count;

  return {{"attack_type_counts", attack_type_counts},
          {"website_incident_counts", website_incident_counts},
          {"total_threat_events", total_attacks},
          {"total_website_incidents", total_website_incidents},
          {"threat_intelligence_ip_count", inputs.threat_intel_ip_count},
          {"rate_limited_ip_count", inputs.rate_limited_ip_count},
          {"top_attacking_ips_last_hour", top_ips}};
}
