#ifndef APP_STATE_HPP
#define APP_STATE_HPP

#include "analysis/traffic_metrics.hpp"
#include "core/config.hpp"
#include "core/metrics_registry.hpp"
#include "io/broadcast/broadcaster.hpp"
#include "io/log_sink/log_sink_dispatcher.hpp"
#include "io/threat_intel/intel_manager.hpp"
#include "response/incident_history.hpp"
#include "response/rate_limiter.hpp"
#include "utils/circuit_breaker.hpp"

#include <memory>

// Shared state of one running service. Created once in main and handed to
// every component that needs it; each member carries its own lock.
struct AppState {
  explicit AppState(std::shared_ptr<const Config::AppConfig> app_config);

  AppState(const AppState &) = delete;
  AppState &operator=(const AppState &) = delete;

  const std::shared_ptr<const Config::AppConfig> config;

  MetricsRegistry metrics;
  std::shared_ptr<circuit_breaker::CircuitBreaker> remote_model_breaker;
  RateLimiter rate_limiter;
  TrafficMetrics traffic;
  Broadcaster broadcaster;
  IncidentHistory history;
  std::shared_ptr<IntelManager> intel;
  LogSinkDispatcher log_sinks;
};

#endif // APP_STATE_HPP
