#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace circuit_breaker {

enum class State {
  CLOSED, // Normal operation
  OPEN    // Short-circuited, calls are skipped until the cooldown elapses
};

// Read-only snapshot of the breaker.
struct BreakerState {
  bool is_open = false;
  size_t failure_count = 0;
  std::chrono::system_clock::time_point last_failure_time{};
  std::string last_error;
};

// Display projection: "OPEN", "DEGRADED" (closed with recent failures) or
// "ACTIVE". Never used for control flow.
std::string status_string(const BreakerState &state);

class CircuitBreaker {
public:
  struct Config {
    size_t failure_threshold;
    std::chrono::milliseconds failure_window;
    std::chrono::milliseconds cooldown;

    Config()
        : failure_threshold(5), failure_window(std::chrono::seconds(60)),
          cooldown(std::chrono::seconds(300)) {}
  };

  explicit CircuitBreaker(const std::string &name,
                          const Config &config = Config{});
  ~CircuitBreaker() = default;

  CircuitBreaker(const CircuitBreaker &) = delete;
  CircuitBreaker &operator=(const CircuitBreaker &) = delete;

  // Runs func unless the circuit is open. The boolean is false when the call
  // was skipped or failed; in both cases default_value is returned. func runs
  // without the breaker lock held.
  template <typename T>
  std::pair<bool, T> execute(std::function<T()> func, T default_value = T{});

  // Returns true when a call may proceed. After the cooldown exactly one
  // caller is admitted as the trial call.
  bool allow_request();
  void record_success();
  void record_failure(const std::string &error);

  State get_state() const;
  BreakerState get_snapshot() const;
  std::string get_status_string() const;
  const std::string &get_name() const { return name_; }

  struct Metrics {
    size_t total_calls = 0;
    size_t successful_calls = 0;
    size_t failed_calls = 0;
    size_t rejected_calls = 0;
    std::chrono::system_clock::time_point last_state_change;
  };

  Metrics get_metrics() const;
  void reset();

private:
  void prune_failures(std::chrono::system_clock::time_point now);
  void transition_to_state(State new_state,
                           std::chrono::system_clock::time_point now);

  const std::string name_;
  const Config config_;

  mutable std::mutex mutex_;
  State state_ = State::CLOSED;
  bool trial_in_flight_ = false;
  std::deque<std::chrono::system_clock::time_point> recent_failures_;
  std::chrono::system_clock::time_point last_failure_time_{};
  std::chrono::system_clock::time_point opened_at_{};
  std::string last_error_;
  Metrics metrics_;
};

template <typename T>
std::pair<bool, T> CircuitBreaker::execute(std::function<T()> func,
                                           T default_value) {
  if (!allow_request())
    return {false, std::move(default_value)};

  try {
    T result = func();
    record_success();
    return {true, std::move(result)};
  } catch (const std::exception &e) {
    record_failure(e.what());
    return {false, std::move(default_value)};
  } catch (...) {
    // Still a failure; otherwise a throwing trial call would never be settled.
    record_failure("unknown error");
    return {false, std::move(default_value)};
  }
}

} // namespace circuit_breaker
