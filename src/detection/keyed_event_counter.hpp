#ifndef KEYED_EVENT_COUNTER_HPP
#define KEYED_EVENT_COUNTER_HPP

#include "utils/sliding_window.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

// Per-key sliding windows of event timestamps, shared by the threshold
// detectors. Keys come from client input, so the map is capped: idle keys are
// swept on an amortized schedule, and at the cap one key is evicted per new
// key. Thread-safe.
class KeyedEventCounter {
public:
  KeyedEventCounter(uint64_t window_ms, size_t max_events_per_key,
                    size_t max_keys = DEFAULT_MAX_KEYS);

  // Records one event for key and returns how many fall inside the window.
  size_t record(const std::string &key, uint64_t now_ms);
  size_t count(const std::string &key, uint64_t now_ms);
  size_t tracked_keys() const;
  size_t evicted_keys() const;

  static constexpr size_t DEFAULT_MAX_KEYS = 100000;

private:
  void make_room(uint64_t now_ms);
  void sweep_idle_keys(uint64_t now_ms);

  static constexpr size_t SWEEP_THRESHOLD = 10000;

  const uint64_t window_ms_;
  const size_t max_events_per_key_;
  const size_t max_keys_;
  const size_t sweep_floor_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, SlidingWindow> windows_;
  size_t inserts_since_sweep_ = 0;
  size_t evicted_keys_ = 0;
};

#endif // KEYED_EVENT_COUNTER_HPP
