#include "analysis/metrics_broadcaster.hpp"
#include "io/broadcast/broadcaster.hpp"
#include "io/broadcast/sse_channel.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

class RecordingObserver : public IObserverChannel {
public:
  enum class Mode { OK, REFUSE, THROW };

  explicit RecordingObserver(Mode mode = Mode::OK) : mode_(mode) {}

  bool deliver(const std::string &message) override {
    if (mode_ == Mode::THROW)
      throw std::runtime_error("socket closed");
    if (mode_ == Mode::REFUSE)
      return false;
    messages.push_back(message);
    return true;
  }
  std::string get_description() const override { return "recording"; }

  std::vector<std::string> messages;

private:
  Mode mode_;
};

} // namespace

class BroadcasterTest : public ::testing::Test {
protected:
  MetricsRegistry metrics;
  Broadcaster broadcaster{&metrics};
};

TEST_F(BroadcasterTest, DeliversToEveryObserver) {
  auto first = std::make_shared<RecordingObserver>();
  auto second = std::make_shared<RecordingObserver>();
  broadcaster.connect(first);
  broadcaster.connect(second);

  broadcaster.broadcast({{"type", "metrics_update"}, {"value", 1}});

  ASSERT_EQ(first->messages.size(), 1u);
  ASSERT_EQ(second->messages.size(), 1u);
  auto decoded = nlohmann::json::parse(first->messages[0]);
  EXPECT_EQ(decoded["type"], "metrics_update");
  EXPECT_EQ(decoded["value"], 1);
  EXPECT_DOUBLE_EQ(metrics.connected_observers.Value(), 2.0);
}

TEST_F(BroadcasterTest, ConnectAndDisconnectAreIdempotent) {
  auto observer = std::make_shared<RecordingObserver>();
  broadcaster.connect(observer);
  broadcaster.connect(observer);
  EXPECT_EQ(broadcaster.observer_count(), 1u);

  broadcaster.disconnect(observer);
  broadcaster.disconnect(observer);
  EXPECT_EQ(broadcaster.observer_count(), 0u);
  EXPECT_DOUBLE_EQ(metrics.connected_observers.Value(), 0.0);
}

TEST_F(BroadcasterTest, FailingObserversAreDroppedOthersStillReceive) {
  auto healthy = std::make_shared<RecordingObserver>();
  auto refusing =
      std::make_shared<RecordingObserver>(RecordingObserver::Mode::REFUSE);
  auto throwing =
      std::make_shared<RecordingObserver>(RecordingObserver::Mode::THROW);
  broadcaster.connect(healthy);
  broadcaster.connect(refusing);
  broadcaster.connect(throwing);

  EXPECT_NO_THROW(broadcaster.broadcast({{"type", "attack_detected"}}));

  EXPECT_EQ(healthy->messages.size(), 1u);
  EXPECT_EQ(broadcaster.observer_count(), 1u);
  EXPECT_DOUBLE_EQ(metrics.broadcast_delivery_failures.Value(), 2.0);

  broadcaster.broadcast({{"type", "attack_detected"}});
  EXPECT_EQ(healthy->messages.size(), 2u);
}

TEST_F(BroadcasterTest, BroadcastWithoutObserversIsNoop) {
  EXPECT_NO_THROW(broadcaster.broadcast({{"type", "website_health"}}));
  EXPECT_DOUBLE_EQ(metrics.broadcast_delivery_failures.Value(), 0.0);
}

TEST_F(BroadcasterTest, MetricsUpdateReportsWindowCounts) {
  Config::MetricsConfig cfg;
  cfg.window_seconds = 60;
  TrafficMetrics traffic(cfg);
  auto breaker = std::make_shared<circuit_breaker::CircuitBreaker>("metrics");
  MetricsBroadcaster updates(cfg, traffic, broadcaster, breaker, &metrics);

  const uint64_t now = 10000000;
  traffic.record_request(now - 120000); // outside the window
  traffic.record_request(now - 1000);
  traffic.record_request(now);
  traffic.record_error_event(now);

  auto observer = std::make_shared<RecordingObserver>();
  broadcaster.connect(observer);

  auto envelope = updates.build_update(now);
  EXPECT_EQ(envelope["type"], "metrics_update");
  EXPECT_EQ(envelope["requests_per_window"], 2);
  EXPECT_EQ(envelope["errors_per_window"], 1);
  EXPECT_EQ(envelope["window_seconds"], 60);
  EXPECT_EQ(envelope["active_observer_count"], 1);
  EXPECT_EQ(envelope["breaker_status"], "ACTIVE");
  EXPECT_DOUBLE_EQ(metrics.breaker_open.Value(), 0.0);
}

TEST_F(BroadcasterTest, SlowSseClientIsDroppedWhenQueueFills) {
  auto slow = std::make_shared<SseChannel>("10.0.0.9", 2);
  broadcaster.connect(slow);

  broadcaster.broadcast({{"n", 1}});
  broadcaster.broadcast({{"n", 2}});
  EXPECT_EQ(broadcaster.observer_count(), 1u);
  broadcaster.broadcast({{"n", 3}});
  EXPECT_EQ(broadcaster.observer_count(), 0u);
  EXPECT_TRUE(slow->is_closed());

  // What was queued before the drop is still flushed, then the stream ends
  // instead of idling on keepalives.
  auto first = slow->next_message(std::chrono::milliseconds(10));
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(SseChannel::format_frame(*first), "data: {\"n\":1}\n\n");
  EXPECT_TRUE(slow->next_message(std::chrono::milliseconds(10)).has_value());
  EXPECT_FALSE(slow->next_message(std::chrono::milliseconds(10)).has_value());

  broadcaster.broadcast({{"n", 4}});
  EXPECT_FALSE(slow->deliver("late"));
}

TEST_F(BroadcasterTest, ClosedSseChannelDrainsThenStops) {
  SseChannel channel("10.0.0.9", 8);
  ASSERT_TRUE(channel.deliver("hello"));
  channel.close();

  EXPECT_FALSE(channel.deliver("late"));
  EXPECT_TRUE(channel.is_closed());
  auto drained = channel.next_message(std::chrono::milliseconds(10));
  ASSERT_TRUE(drained.has_value());
  EXPECT_EQ(*drained, "hello");
  EXPECT_FALSE(channel.next_message(std::chrono::milliseconds(10)).has_value());
  EXPECT_EQ(channel.get_description(), "sse:10.0.0.9");
}
