#include "keyed_event_counter.hpp"

#include <algorithm>

KeyedEventCounter::KeyedEventCounter(uint64_t window_ms,
                                     size_t max_events_per_key,
                                     size_t max_keys)
    : window_ms_(window_ms), max_events_per_key_(max_events_per_key),
      max_keys_(std::max<size_t>(max_keys, 1)),
      sweep_floor_(std::min(SWEEP_THRESHOLD, max_keys_)) {}

size_t KeyedEventCounter::record(const std::string &key, uint64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = windows_.find(key);
  if (it == windows_.end()) {
    make_room(now_ms);
    it = windows_
             .emplace(key, SlidingWindow(window_ms_, max_events_per_key_))
             .first;
  }

  it->second.record(now_ms);
  it->second.prune(now_ms);
  return it->second.size();
}

size_t KeyedEventCounter::count(const std::string &key, uint64_t now_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = windows_.find(key);
  if (it == windows_.end())
    return 0;
  it->second.prune(now_ms);
  return it->second.size();
}

size_t KeyedEventCounter::tracked_keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return windows_.size();
}

size_t KeyedEventCounter::evicted_keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return evicted_keys_;
}

// A full sweep costs O(keys), so it runs at most once per keys/2 new keys.
void KeyedEventCounter::make_room(uint64_t now_ms) {
  ++inserts_since_sweep_;
  if (windows_.size() >= sweep_floor_ &&
      inserts_since_sweep_ >= std::max<size_t>(windows_.size() / 2, 1)) {
    sweep_idle_keys(now_ms);
    inserts_since_sweep_ = 0;
  }

  if (windows_.size() >= max_keys_) {
    windows_.erase(windows_.begin());
    ++evicted_keys_;
  }
}

void KeyedEventCounter::sweep_idle_keys(uint64_t now_ms) {
  for (auto it = windows_.begin(); it != windows_.end();) {
    it->second.prune(now_ms);
    if (it->second.empty())
      it = windows_.erase(it);
    else
      ++it;
  }
}
