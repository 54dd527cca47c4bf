#include "metrics_broadcaster.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <chrono>

MetricsBroadcaster::MetricsBroadcaster(
    const Config::MetricsConfig &cfg, TrafficMetrics &traffic,
    Broadcaster &broadcaster,
    std::shared_ptr<circuit_breaker::CircuitBreaker> breaker,
    MetricsRegistry *metrics)
    : config_(cfg), traffic_(traffic), broadcaster_(broadcaster),
      breaker_(std::move(breaker)), metrics_(metrics) {}

MetricsBroadcaster::~MetricsBroadcaster() { stop(); }

void MetricsBroadcaster::start() {
  LOG(LogLevel::INFO, LogComponent::METRICS,
      "Metrics broadcast task started (every "
          << config_.broadcast_interval_seconds << "s).");
  task_.start([this](CancellableTask &task) { run(task); });
}

void MetricsBroadcaster::stop() {
  task_.cancel();
  task_.join();
}

nlohmann::json MetricsBroadcaster::build_update(uint64_t now_ms) {
  traffic_.prune(now_ms);
  auto snapshot = traffic_.snapshot();

  std::string breaker_status = "ACTIVE";
  if (breaker_) {
    auto state = breaker_->get_snapshot();
    breaker_status = circuit_breaker::status_string(state);
    if (metrics_)
      metrics_->breaker_open.Set(state.is_open ? 1.0 : 0.0);
  }

  nlohmann::json body = {
      {"requests_per_window", snapshot.requests},
      {"errors_per_window", snapshot.error_events},
      {"window_seconds", config_.window_seconds},
      {"active_observer_count", broadcaster_.observer_count()},
      {"breaker_status", breaker_status}};
  return JsonFormatter::make_envelope("metrics_update", body);
}

void MetricsBroadcaster::run(CancellableTask &task) {
  const auto interval = std::chrono::seconds(config_.broadcast_interval_seconds);
  while (task.wait_for(interval)) {
    try {
      broadcaster_.broadcast(build_update(Utils::get_current_time_ms()));
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::METRICS,
          "Metrics loop error: " << e.what());
    }
  }
  LOG(LogLevel::INFO, LogComponent::METRICS, "Metrics broadcast task stopped.");
}
