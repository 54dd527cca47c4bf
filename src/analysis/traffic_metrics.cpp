#include "traffic_metrics.hpp"

TrafficMetrics::TrafficMetrics(const Config::MetricsConfig &cfg)
    : requests_(cfg.window_seconds * 1000, cfg.max_samples),
      error_events_(cfg.window_seconds * 1000, cfg.max_samples) {}

void TrafficMetrics::record_request(uint64_t timestamp_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.record(timestamp_ms);
}

void TrafficMetrics::record_error_event(uint64_t timestamp_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_events_.record(timestamp_ms);
}

void TrafficMetrics::prune(uint64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.prune(now_ms);
  error_events_.prune(now_ms);
}

TrafficMetrics::Snapshot TrafficMetrics::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return Snapshot{requests_.size(), error_events_.size()};
}

size_t TrafficMetrics::error_events_since(uint64_t since_ms) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_events_.count_since(since_ms);
}
