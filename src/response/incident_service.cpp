#include "incident_service.hpp"
#include "core/logger.hpp"
#include "monitoring/health_classifier.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

const char *outcome_to_string(IncidentService::Outcome outcome) {
  switch (outcome) {
  case IncidentService::Outcome::NO_THREAT:
    return "no_threat";
  case IncidentService::Outcome::THREAT_DETECTED:
    return "threat_detected";
  case IncidentService::Outcome::BLOCKED:
    return "blocked";
  case IncidentService::Outcome::ALREADY_BLOCKED:
    return "already_blocked";
  }
  return "unknown";
}

IncidentService::IncidentService(AppState &state, DetectorPipeline &pipeline,
                                 EnrichmentWorker *enrichment)
    : state_(state), pipeline_(pipeline), enrichment_(enrichment),
      scorer_(state.config->risk_scoring) {}

std::string IncidentService::next_incident_id(uint64_t timestamp_ms) {
  return "inc-" + std::to_string(timestamp_ms) + "-" +
         std::to_string(++incident_sequence_);
}

IncidentReport
IncidentService::build_report(const Event &event,
                              const std::vector<Detection> &detections,
                              const RiskScore &risk, uint64_t timestamp_ms) {
  IncidentReport report;
  report.incident_id = next_incident_id(timestamp_ms);
  report.timestamp_ms = timestamp_ms;
  report.source_ip = event.source_ip;
  report.primary = detections[scorer_.primary_index(detections)];
  report.risk = risk;
  report.detection_count = detections.size();
  report.event_type = event.event_type;
  report.user_id = event.user_id;
  report.event_data = event.payload;
  return report;
}

void IncidentService::publish(const IncidentReport &report) {
  nlohmann::json record = JsonFormatter::incident_to_json_object(report);
  state_.log_sinks.submit(record);
  state_.broadcaster.broadcast(
      JsonFormatter::make_envelope("attack_detected", record));
}

IncidentService::EventResult IncidentService::submit_event(const Event &event) {
  const uint64_t now_ms = Utils::get_current_time_ms();
  state_.metrics.events_received.Increment();
  state_.traffic.record_request(now_ms);

  EventResult result;
  if (state_.rate_limiter.should_block(event.source_ip)) {
    LOG(LogLevel::INFO, LogComponent::PIPELINE,
        "Event " << event.event_type << " from blocked IP " << event.source_ip
                 << " rejected.");
    result.outcome = Outcome::ALREADY_BLOCKED;
    return result;
  }

  auto detections = pipeline_.evaluate(event);
  if (detections.empty()) {
    LOG(LogLevel::DEBUG, LogComponent::PIPELINE,
        "Event " << event.event_type << " from " << event.source_ip
                 << ": No threat detected.");
    return result;
  }

  state_.metrics.threats_detected.Increment();
  state_.traffic.record_error_event(now_ms);

  RiskScore risk = scorer_.score(event, detections);
  IncidentReport report = build_report(event, detections, risk, now_ms);

  state_.history.record_attack(report);
  publish(report);
  if (enrichment_)
    enrichment_->submit(report);

  result.outcome = Outcome::THREAT_DETECTED;
  if (state_.rate_limiter.record_high_risk(event.source_ip, risk)) {
    state_.metrics.ip_blocks_applied.Increment();
    result.outcome = Outcome::BLOCKED;
  }

  LOG(LogLevel::INFO, LogComponent::PIPELINE,
      "Event " << event.event_type << " from " << event.source_ip
               << ": Detected " << severity_to_string(risk.severity) << " ("
               << report.primary.attack_type << "), incident "
               << report.incident_id << ", "
               << outcome_to_string(result.outcome));
  result.report = std::move(report);
  return result;
}

void IncidentService::handle_health_record(const HealthRecord &record) {
  state_.broadcaster.broadcast(JsonFormatter::make_envelope(
      "website_health", JsonFormatter::health_record_to_json_object(record)));

  auto finding = HealthClassifier::finding_for(record);
  if (!finding || finding->severity < Severity::MEDIUM)
    return;

  Event monitor_event;
  monitor_event.event_type = "website_monitor";
  monitor_event.source_ip = WEBSITE_MONITOR_SOURCE;
  monitor_event.payload = {{"url", record.url},
                           {"status", health_status_to_string(record.status)},
                           {"response_time", record.response_time_ms}};

  std::vector<Detection> detections{*finding};
  RiskScore risk = scorer_.score(monitor_event, detections);
  IncidentReport report =
      build_report(monitor_event, detections, risk, record.last_check_ms);

  state_.history.record_website_incident(report);
  publish(report);

  LOG(LogLevel::WARN, LogComponent::MONITOR,
      "Website incident " << report.incident_id << " for " << record.url
                          << ": " << finding->attack_type);
}
