#include "log_sink_dispatcher.hpp"
#include "core/logger.hpp"

LogSinkDispatcher::~LogSinkDispatcher() { shutdown(); }

void LogSinkDispatcher::add_sink(std::shared_ptr<ILogSink> sink) {
  if (!sink)
    return;
  LOG(LogLevel::INFO, LogComponent::IO_SINK,
      "LogSinkDispatcher: " << sink->get_name() << " enabled.");
  sinks_.push_back(std::move(sink));
}

void LogSinkDispatcher::start() {
  dispatcher_thread_ = std::thread(&LogSinkDispatcher::dispatcher_loop, this);
}

void LogSinkDispatcher::shutdown() {
  record_queue_.shutdown();
  if (dispatcher_thread_.joinable())
    dispatcher_thread_.join();
}

bool LogSinkDispatcher::submit(nlohmann::json record) {
  if (sinks_.empty())
    return false;
  if (!record_queue_.push(std::move(record))) {
    LOG(LogLevel::WARN, LogComponent::IO_SINK,
        "LogSinkDispatcher is backlogged or shut down, record dropped.");
    return false;
  }
  return true;
}

void LogSinkDispatcher::dispatcher_loop() {
  nlohmann::json record;
  while (record_queue_.wait_and_pop(record)) {
    for (const auto &sink : sinks_) {
      try {
        if (sink->persist(record))
          persisted_count_++;
        else
          LOG(LogLevel::WARN, LogComponent::IO_SINK,
              sink->get_name() << " failed to persist incident.");
      } catch (const std::exception &e) {
        LOG(LogLevel::ERROR, LogComponent::IO_SINK,
            "Exception in " << sink->get_name() << ": " << e.what());
      }
    }
  }
  LOG(LogLevel::DEBUG, LogComponent::IO_SINK, "LogSinkDispatcher stopped.");
}
