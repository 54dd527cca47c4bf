#ifndef METRICS_BROADCASTER_HPP
#define METRICS_BROADCASTER_HPP

#include "analysis/traffic_metrics.hpp"
#include "core/config.hpp"
#include "core/metrics_registry.hpp"
#include "io/broadcast/broadcaster.hpp"
#include "utils/cancellable_task.hpp"
#include "utils/circuit_breaker.hpp"

#include <nlohmann/json.hpp>

#include <memory>

// Periodically prunes the traffic windows and publishes a metrics_update
// envelope to every observer.
class MetricsBroadcaster {
public:
  MetricsBroadcaster(const Config::MetricsConfig &cfg, TrafficMetrics &traffic,
                     Broadcaster &broadcaster,
                     std::shared_ptr<circuit_breaker::CircuitBreaker> breaker,
                     MetricsRegistry *metrics = nullptr);
  ~MetricsBroadcaster();

  void start();
  void stop();

  // Prunes both windows relative to now_ms and builds the envelope.
  nlohmann::json build_update(uint64_t now_ms);

private:
  void run(CancellableTask &task);

  const Config::MetricsConfig config_;
  TrafficMetrics &traffic_;
  Broadcaster &broadcaster_;
  std::shared_ptr<circuit_breaker::CircuitBreaker> breaker_;
  MetricsRegistry *metrics_;
  CancellableTask task_{"metrics_broadcaster"};
};

#endif // METRICS_BROADCASTER_HPP
