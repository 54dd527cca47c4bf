#include "broadcaster.hpp"
#include "core/logger.hpp"

#include <vector>

void Broadcaster::connect(std::shared_ptr<IObserverChannel> observer) {
  if (!observer)
    return;

  size_t count;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.insert(observer);
    count = observers_.size();
  }
  update_observer_gauge(count);
  LOG(LogLevel::INFO, LogComponent::BROADCAST,
      "Observer connected: " << observer->get_description()
                             << " | Total: " << count);
}

void Broadcaster::disconnect(const std::shared_ptr<IObserverChannel> &observer) {
  size_t count;
  bool removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    removed = observers_.erase(observer) > 0;
    count = observers_.size();
  }
  if (!removed)
    return;

  update_observer_gauge(count);
  LOG(LogLevel::INFO, LogComponent::BROADCAST,
      "Observer disconnected: " << observer->get_description()
                                << " | Total: " << count);
}

void Broadcaster::broadcast(const nlohmann::json &message) {
  std::vector<std::shared_ptr<IObserverChannel>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (observers_.empty())
      return;
    snapshot.assign(observers_.begin(), observers_.end());
  }

  std::string payload;
  try {
    payload = message.dump();
  } catch (const nlohmann::json::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::BROADCAST,
        "Message serialization failed: " << e.what());
    return;
  }

  std::vector<std::shared_ptr<IObserverChannel>> failed;
  for (const auto &observer : snapshot) {
    try {
      if (!observer->deliver(payload))
        failed.push_back(observer);
    } catch (const std::exception &e) {
      LOG(LogLevel::WARN, LogComponent::BROADCAST,
          "Delivery to " << observer->get_description()
                         << " threw: " << e.what());
      failed.push_back(observer);
    }
  }

  if (failed.empty())
    return;

  LOG(LogLevel::WARN, LogComponent::BROADCAST,
      "Dropping " << failed.size() << " observer(s) after failed delivery.");
  if (metrics_)
    metrics_->broadcast_delivery_failures.Increment(
        static_cast<double>(failed.size()));
  for (const auto &observer : failed)
    disconnect(observer);
}

size_t Broadcaster::observer_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return observers_.size();
}

void Broadcaster::update_observer_gauge(size_t count) {
  if (metrics_)
    metrics_->connected_observers.Set(static_cast<double>(count));
}
