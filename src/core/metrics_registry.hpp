#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <memory>
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>
#include <string>

// Process metrics exported at /metrics. One instance is owned by AppState.
class MetricsRegistry {
public:
  MetricsRegistry();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  // Renders every registered family in the Prometheus text format.
  std::string serialize() const;

private:
  std::shared_ptr<prometheus::Registry> registry_;

public:
  // Handles used by the pipeline and the web layer.
  prometheus::Counter &events_received;
  prometheus::Counter &threats_detected;
  prometheus::Counter &ip_blocks_applied;
  prometheus::Counter &broadcast_delivery_failures;
  prometheus::Gauge &breaker_open;
  prometheus::Gauge &connected_observers;
  prometheus::Gauge &active_monitors;
};

#endif // METRICS_REGISTRY_HPP
