#include "circuit_breaker.hpp"
#include "core/logger.hpp"

namespace circuit_breaker {

std::string status_string(const BreakerState &state) {
  if (state.is_open)
    return "OPEN";
  if (state.failure_count > 0)
    return "DEGRADED";
  return "ACTIVE";
}

CircuitBreaker::CircuitBreaker(const std::string &name, const Config &config)
    : name_(name), config_(config) {
  metrics_.last_state_change = std::chrono::system_clock::now();
}

bool CircuitBreaker::allow_request() {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.total_calls++;

  if (state_ == State::CLOSED)
    return true;

  auto now = std::chrono::system_clock::now();
  if (!trial_in_flight_ && now - opened_at_ >= config_.cooldown) {
    trial_in_flight_ = true;
    LOG(LogLevel::INFO, LogComponent::BREAKER,
        "Circuit '" << name_ << "' cooldown elapsed, admitting trial call.");
    return true;
  }

  metrics_.rejected_calls++;
  return false;
}

void CircuitBreaker::record_success() {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.successful_calls++;
  recent_failures_.clear();
  trial_in_flight_ = false;

  if (state_ == State::OPEN) {
    transition_to_state(State::CLOSED, std::chrono::system_clock::now());
    LOG(LogLevel::INFO, LogComponent::BREAKER,
        "Circuit '" << name_ << "' closed after successful trial call.");
  }
}

void CircuitBreaker::record_failure(const std::string &error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = std::chrono::system_clock::now();
  metrics_.failed_calls++;
  last_failure_time_ = now;
  last_error_ = error;

  if (state_ == State::OPEN) {
    // Failed trial call: stay open and restart the cooldown
    trial_in_flight_ = false;
    opened_at_ = now;
    recent_failures_.push_back(now);
    LOG(LogLevel::WARN, LogComponent::BREAKER,
        "Circuit '" << name_ << "' trial call failed, remaining open: " << error);
    return;
  }

  prune_failures(now);
  recent_failures_.push_back(now);
  LOG(LogLevel::DEBUG, LogComponent::BREAKER,
      "Circuit '" << name_ << "' failure " << recent_failures_.size() << "/"
                  << config_.failure_threshold << ": " << error);

  if (recent_failures_.size() >= config_.failure_threshold) {
    opened_at_ = now;
    transition_to_state(State::OPEN, now);
    LOG(LogLevel::WARN, LogComponent::BREAKER,
        "Circuit '" << name_ << "' opened after " << recent_failures_.size()
                    << " failures. Last error: " << error);
  }
}

State CircuitBreaker::get_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

BreakerState CircuitBreaker::get_snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  BreakerState snapshot;
  snapshot.is_open = state_ == State::OPEN;
  snapshot.failure_count = recent_failures_.size();
  snapshot.last_failure_time = last_failure_time_;
  snapshot.last_error = last_error_;
  return snapshot;
}

std::string CircuitBreaker::get_status_string() const {
  return status_string(get_snapshot());
}

CircuitBreaker::Metrics CircuitBreaker::get_metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

void CircuitBreaker::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = State::CLOSED;
  trial_in_flight_ = false;
  recent_failures_.clear();
  last_error_.clear();
  metrics_ = Metrics{};
  metrics_.last_state_change = std::chrono::system_clock::now();
}

void CircuitBreaker::prune_failures(std::chrono::system_clock::time_point now) {
  while (!recent_failures_.empty() &&
         now - recent_failures_.front() > config_.failure_window)
    recent_failures_.pop_front();
}

void CircuitBreaker::transition_to_state(
    State new_state, std::chrono::system_clock::time_point now) {
  if (state_ != new_state) {
    state_ = new_state;
    metrics_.last_state_change = now;
  }
}

} // namespace circuit_breaker
