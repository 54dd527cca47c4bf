#ifndef INCIDENT_SERVICE_HPP
#define INCIDENT_SERVICE_HPP

#include "core/app_state.hpp"
#include "core/incident.hpp"
#include "detection/detector_pipeline.hpp"
#include "detection/risk_scorer.hpp"
#include "io/geo/enrichment_worker.hpp"
#include "monitoring/health_record.hpp"

#include <atomic>
#include <optional>
#include <string>

// The detection and adaptive response path shared by /log_event, the attack
// simulation and the website monitors.
class IncidentService {
public:
  enum class Outcome { NO_THREAT, THREAT_DETECTED, BLOCKED, ALREADY_BLOCKED };

  struct EventResult {
    Outcome outcome = Outcome::NO_THREAT;
    std::optional<IncidentReport> report;
  };

  // enrichment may be null, in which case no location updates are sent.
  IncidentService(AppState &state, DetectorPipeline &pipeline,
                  EnrichmentWorker *enrichment = nullptr);

  EventResult submit_event(const Event &event);

  // Broadcasts the record and raises a website incident for MEDIUM or
  // higher findings.
  void handle_health_record(const HealthRecord &record);

  std::string next_incident_id(uint64_t timestamp_ms);

private:
  IncidentReport build_report(const Event &event,
                              const std::vector<Detection> &detections,
                              const RiskScore &risk, uint64_t timestamp_ms);
  void publish(const IncidentReport &report);

  AppState &state_;
  DetectorPipeline &pipeline_;
  EnrichmentWorker *enrichment_;
  RiskScorer scorer_;
  std::atomic<uint64_t> incident_sequence_{0};
};

const char *outcome_to_string(IncidentService::Outcome outcome);

#endif // INCIDENT_SERVICE_HPP
