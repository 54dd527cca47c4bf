#ifndef SSE_CHANNEL_HPP
#define SSE_CHANNEL_HPP

#include "io/broadcast/observer_channel.hpp"
#include "utils/thread_safe_queue.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

// Observer backed by a Server-Sent-Events response. The broadcaster enqueues
// messages; the HTTP worker serving the stream drains them. A full queue
// means the client is not keeping up: the delivery fails and the channel
// closes, so the stream ends once drained and the client reconnects.
class SseChannel : public IObserverChannel {
public:
  SseChannel(std::string peer, size_t queue_limit)
      : peer_(std::move(peer)), pending_(queue_limit) {}

  bool deliver(const std::string &message) override {
    if (closed_)
      return false;
    if (pending_.push(message))
      return true;
    close();
    return false;
  }

  std::string get_description() const override { return "sse:" + peer_; }

  // Next message, or nullopt after timeout or once closed and drained.
  std::optional<std::string> next_message(std::chrono::milliseconds timeout) {
    return pending_.wait_and_pop_for(timeout);
  }

  void close() {
    closed_ = true;
    pending_.shutdown();
  }

  bool is_closed() const { return closed_.load(); }

  // One SSE frame per message.
  static std::string format_frame(const std::string &message) {
    return "data: " + message + "\n\n";
  }
  static constexpr const char *KEEPALIVE_FRAME = ": keepalive\n\n";

private:
  const std::string peer_;
  ThreadSafeQueue<std::string> pending_;
  std::atomic<bool> closed_{false};
};

#endif // SSE_CHANNEL_HPP
