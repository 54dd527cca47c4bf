#ifndef SLIDING_WINDOW_HPP
#define SLIDING_WINDOW_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <iterator>

// Event timestamps in ascending order, bounded by age and optionally by count.
// Not thread-safe; owners wrap it in their own lock.
class SlidingWindow {
public:
  explicit SlidingWindow(uint64_t span_ms, size_t capacity = 0)
      : span_ms_(span_ms), capacity_(capacity) {}

  // A timestamp older than the newest one is stored as the newest, so the
  // deque stays sorted.
  void record(uint64_t timestamp_ms) {
    if (!stamps_.empty())
      timestamp_ms = std::max(timestamp_ms, stamps_.back());
    stamps_.push_back(timestamp_ms);
    if (capacity_ > 0 && stamps_.size() > capacity_)
      stamps_.pop_front();
  }

  // Drops everything older than now_ms - span. A zero span keeps all.
  void prune(uint64_t now_ms) {
    if (span_ms_ == 0 || now_ms < span_ms_)
      return;
    stamps_.erase(stamps_.begin(), first_at_or_after(now_ms - span_ms_));
  }

  size_t count_since(uint64_t since_ms) const {
    return static_cast<size_t>(
        std::distance(first_at_or_after(since_ms), stamps_.end()));
  }

  size_t size() const { return stamps_.size(); }
  bool empty() const { return stamps_.empty(); }
  uint64_t oldest() const { return stamps_.empty() ? 0 : stamps_.front(); }
  uint64_t newest() const { return stamps_.empty() ? 0 : stamps_.back(); }

private:
  std::deque<uint64_t>::const_iterator
  first_at_or_after(uint64_t timestamp_ms) const {
    return std::lower_bound(stamps_.begin(), stamps_.end(), timestamp_ms);
  }

  std::deque<uint64_t> stamps_;
  const uint64_t span_ms_;
  const size_t capacity_;
};

#endif // SLIDING_WINDOW_HPP
