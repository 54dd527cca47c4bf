#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <deque>

// Hand-off queue between request handlers and background workers.
template <typename T> class ThreadSafeQueue {
public:
  // 0 means unbounded.
  explicit ThreadSafeQueue(size_t capacity = 0) : capacity_(capacity) {}

  // Returns false when the queue is full or shutting down.
  bool push(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_)
        return false;
      if (capacity_ > 0 && items_.size() >= capacity_)
        return false;
      items_.push_back(std::move(value));
    }
    item_ready_.notify_one();
    return true;
  }

  // Blocks for the next item. False once shut down and drained.
  bool wait_and_pop(T &value) {
    std::unique_lock<std::mutex> lock(mutex_);
    item_ready_.wait(lock, [this] { return !items_.empty() || closed_; });
    if (closed_ && items_.empty())
      return false;

    value = std::move(items_.front());
    items_.pop_front();
    return true;
  }

  // Like wait_and_pop, but gives up after timeout. Returns nullopt on timeout
  // and on shutdown once drained.
  template <typename Rep, typename Period>
  std::optional<T>
  wait_and_pop_for(const std::chrono::duration<Rep, Period> &timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    item_ready_.wait_for(lock, timeout,
                   [this] { return !items_.empty() || closed_; });
    if (items_.empty())
      return std::nullopt;

    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  // Refuses further pushes and wakes every waiter. Queued items still drain.
  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    item_ready_.notify_all();
  }

private:
  std::mutex mutex_;
  std::deque<T> items_;
  std::condition_variable item_ready_;
  const size_t capacity_;
  bool closed_ = false;
};

#endif // THREAD_SAFE_QUEUE_HPP
