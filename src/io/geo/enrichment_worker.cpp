#include "enrichment_worker.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"

EnrichmentWorker::EnrichmentWorker(std::shared_ptr<IGeolocator> geolocator,
                                   Broadcaster &broadcaster,
                                   size_t queue_limit)
    : geolocator_(std::move(geolocator)), broadcaster_(broadcaster),
      queue_(queue_limit) {}

EnrichmentWorker::~EnrichmentWorker() { shutdown(); }

void EnrichmentWorker::start() {
  worker_thread_ = std::thread(&EnrichmentWorker::worker_loop, this);
}

void EnrichmentWorker::shutdown() {
  queue_.shutdown();
  if (worker_thread_.joinable())
    worker_thread_.join();
}

bool EnrichmentWorker::submit(const IncidentReport &report) {
  if (report.source_ip.empty() || report.source_ip == WEBSITE_MONITOR_SOURCE)
    return false;
  if (queue_.push(report))
    return true;
  LOG(LogLevel::WARN, LogComponent::IO_GEO,
      "Enrichment queue full, " << report.incident_id
                                << " keeps its placeholder location.");
  return false;
}

IncidentReport EnrichmentWorker::enrich(const IncidentReport &report) {
  IncidentReport updated = report;
  updated.location = geolocator_ ? geolocator_->locate(report.source_ip)
                                 : GeoLocation{};
  updated.is_update = true;
  return updated;
}

void EnrichmentWorker::worker_loop() {
  IncidentReport report;
  while (queue_.wait_and_pop(report)) {
    try {
      IncidentReport updated = enrich(report);
      LOG(LogLevel::DEBUG, LogComponent::IO_GEO,
          "Location for " << updated.source_ip << ": "
                          << updated.location->city << ", "
                          << updated.location->country << " (incident "
                          << updated.incident_id << ")");
      broadcaster_.broadcast(JsonFormatter::make_envelope(
          "attack_detected", JsonFormatter::incident_to_json_object(updated)));
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::IO_GEO,
          "Enrichment of incident " << report.incident_id
                                    << " failed: " << e.what());
    }
  }
}
