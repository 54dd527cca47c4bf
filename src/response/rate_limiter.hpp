#ifndef RATE_LIMITER_HPP
#define RATE_LIMITER_HPP

#include "core/config.hpp"
#include "core/incident.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

// Temporary per-IP blocks derived from risk outcomes. Expired entries are
// ignored on read and overwritten on the next block; nothing sweeps them.
class RateLimiter {
public:
  using TimeSource = std::function<uint64_t()>;

  explicit RateLimiter(const Config::RateLimitConfig &cfg,
                       TimeSource now = nullptr);

  bool should_block(const std::string &ip) const;

  // Blocks ip for block_duration when the risk is CRITICAL or its score
  // reaches the threshold. Returns true when a block was applied.
  bool record_high_risk(const std::string &ip, const RiskScore &risk);

  bool qualifies_for_block(const RiskScore &risk) const;
  size_t active_block_count() const;
  uint64_t block_expiry_ms(const std::string &ip) const;

private:
  const Config::RateLimitConfig config_;
  TimeSource now_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, uint64_t> blocked_until_ms_;
};

#endif // RATE_LIMITER_HPP
