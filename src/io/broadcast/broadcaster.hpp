#ifndef BROADCASTER_HPP
#define BROADCASTER_HPP

#include "core/metrics_registry.hpp"
#include "io/broadcast/observer_channel.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <unordered_set>

// Fans one message out to every connected observer. A failing observer is
// removed without affecting the others, and broadcast() never reports
// delivery problems to its caller.
class Broadcaster {
public:
  explicit Broadcaster(MetricsRegistry *metrics = nullptr)
      : metrics_(metrics) {}

  // Both are idempotent.
  void connect(std::shared_ptr<IObserverChannel> observer);
  void disconnect(const std::shared_ptr<IObserverChannel> &observer);

  void broadcast(const nlohmann::json &message);

  size_t observer_count() const;

private:
  void update_observer_gauge(size_t count);

  MetricsRegistry *metrics_;
  mutable std::mutex mutex_;
  std::unordered_set<std::shared_ptr<IObserverChannel>> observers_;
};

#endif // BROADCASTER_HPP
