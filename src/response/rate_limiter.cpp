#include "rate_limiter.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

RateLimiter::RateLimiter(const Config::RateLimitConfig &cfg, TimeSource now)
    : config_(cfg), now_(std::move(now)) {
  if (!now_)
    now_ = &Utils::get_current_time_ms;
}

bool RateLimiter::should_block(const std::string &ip) const {
  const uint64_t now = now_();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = blocked_until_ms_.find(ip);
  return it != blocked_until_ms_.end() && now < it->second;
}

bool RateLimiter::qualifies_for_block(const RiskScore &risk) const {
  return risk.severity == Severity::CRITICAL ||
         risk.score >= config_.score_threshold;
}

bool RateLimiter::record_high_risk(const std::string &ip,
                                   const RiskScore &risk) {
  if (!qualifies_for_block(risk))
    return false;

  const uint64_t expiry = now_() + config_.block_duration_seconds * 1000;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    blocked_until_ms_[ip] = expiry;
  }

  LOG(LogLevel::WARN, LogComponent::RATE_LIMIT,
      "IP " << ip << " blocked for " << config_.block_duration_seconds
            << "s (" << severity_to_string(risk.severity)
            << ", score " << risk.score << ")");
  return true;
}

size_t RateLimiter::active_block_count() const {
  const uint64_t now = now_();
  std::lock_guard<std::mutex> lock(mutex_);
  size_t active = 0;
  for (const auto &[ip, expiry] : blocked_until_ms_)
    if (now < expiry)
      ++active;
  return active;
}

uint64_t RateLimiter::block_expiry_ms(const std::string &ip) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = blocked_until_ms_.find(ip);
  return it == blocked_until_ms_.end() ? 0 : it->second;
}
