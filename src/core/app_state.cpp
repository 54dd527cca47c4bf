#include "app_state.hpp"

#include <chrono>

namespace {

circuit_breaker::CircuitBreaker::Config
breaker_config_from(const Config::CircuitBreakerConfig &cfg) {
  circuit_breaker::CircuitBreaker::Config breaker_cfg;
  breaker_cfg.failure_threshold = cfg.failure_threshold;
  breaker_cfg.failure_window = std::chrono::seconds(cfg.failure_window_seconds);
  breaker_cfg.cooldown = std::chrono::seconds(cfg.cooldown_seconds);
  return breaker_cfg;
}

} // namespace

AppState::AppState(std::shared_ptr<const Config::AppConfig> app_config)
    : config(std::move(app_config)),
      remote_model_breaker(std::make_shared<circuit_breaker::CircuitBreaker>(
          "remote_model", breaker_config_from(config->circuit_breaker))),
      rate_limiter(config->rate_limit), traffic(config->metrics),
      broadcaster(&metrics),
      intel(std::make_shared<IntelManager>(
          config->threat_intel.enabled ? config->threat_intel.feed_urls
                                       : std::vector<std::string>{},
          config->threat_intel.update_interval_seconds)),
      log_sinks(config->log_sink.queue_limit) {}
