#ifndef LOG_SINK_DISPATCHER_HPP
#define LOG_SINK_DISPATCHER_HPP

#include "base_log_sink.hpp"
#include "utils/thread_safe_queue.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

// Writes incident records to every configured sink on a background thread so
// request handlers never wait on disk or database I/O.
class LogSinkDispatcher {
public:
  // Records beyond queue_limit pending ones are dropped.
  explicit LogSinkDispatcher(size_t queue_limit) : record_queue_(queue_limit) {}
  ~LogSinkDispatcher();

  LogSinkDispatcher(const LogSinkDispatcher &) = delete;
  LogSinkDispatcher &operator=(const LogSinkDispatcher &) = delete;

  // Sinks must be added before start().
  void add_sink(std::shared_ptr<ILogSink> sink);
  void start();

  // Drains what is already queued, then stops the worker.
  void shutdown();

  bool submit(nlohmann::json record);
  size_t sink_count() const { return sinks_.size(); }
  size_t persisted_count() const { return persisted_count_.load(); }

private:
  void dispatcher_loop();

  std::vector<std::shared_ptr<ILogSink>> sinks_;
  ThreadSafeQueue<nlohmann::json> record_queue_;
  std::thread dispatcher_thread_;
  std::atomic<size_t> persisted_count_{0};
};

#endif // LOG_SINK_DISPATCHER_HPP
