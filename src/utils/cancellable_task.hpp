#ifndef CANCELLABLE_TASK_HPP
#define CANCELLABLE_TASK_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// A background thread that can be asked to stop. The body polls
// is_cancelled() or sleeps through wait_for(), which wakes early on cancel.
// The destructor cancels and joins.
class CancellableTask {
public:
  using Body = std::function<void(CancellableTask &)>;

  explicit CancellableTask(std::string name) : name_(std::move(name)) {}
  ~CancellableTask() {
    cancel();
    join();
  }

  CancellableTask(const CancellableTask &) = delete;
  CancellableTask &operator=(const CancellableTask &) = delete;

  void start(Body body) {
    thread_ = std::thread([this, body = std::move(body)]() {
      body(*this);
      finished_ = true;
    });
  }

  void cancel() {
    {
      std::lock_guard<std::mutex> lock(cv_mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  // Safe to call more than once and on a task that already ended.
  void join() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
      thread_.join();
  }

  bool is_cancelled() const { return cancelled_.load(); }
  bool is_finished() const { return finished_.load(); }
  const std::string &name() const { return name_; }

  // Sleeps up to timeout. Returns false when woken by cancel().
  template <typename Rep, typename Period>
  bool wait_for(const std::chrono::duration<Rep, Period> &timeout) {
    std::unique_lock<std::mutex> lock(cv_mutex_);
    cv_.wait_for(lock, timeout, [this] { return cancelled_.load(); });
    return !cancelled_.load();
  }

private:
  const std::string name_;
  std::thread thread_;
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> finished_{false};

  std::condition_variable cv_;
  std::mutex cv_mutex_;
  std::mutex join_mutex_;
};

#endif // CANCELLABLE_TASK_HPP
