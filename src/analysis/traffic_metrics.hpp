#ifndef TRAFFIC_METRICS_HPP
#define TRAFFIC_METRICS_HPP

#include "core/config.hpp"
#include "utils/sliding_window.hpp"

#include <cstdint>
#include <mutex>

// Request and error-event timestamps over the metrics window.
class TrafficMetrics {
public:
  explicit TrafficMetrics(const Config::MetricsConfig &cfg);

  void record_request(uint64_t timestamp_ms);
  void record_error_event(uint64_t timestamp_ms);

  // Drops everything older than the window relative to now_ms.
  void prune(uint64_t now_ms);

  struct Snapshot {
    size_t requests = 0;
    size_t error_events = 0;
  };
  Snapshot snapshot() const;

  // Error events at or after since_ms.
  size_t error_events_since(uint64_t since_ms) const;

private:
  mutable std::mutex mutex_;
  SlidingWindow requests_;
  SlidingWindow error_events_;
};

#endif // TRAFFIC_METRICS_HPP
