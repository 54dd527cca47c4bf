#include "monitoring/monitor_registry.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace {

class FakeBackend : public IMonitorBackend {
public:
  explicit FakeBackend(HealthStatus status, bool throws = false)
      : status_(status), throws_(throws) {}

  HealthRecord check(const MonitorConfig &config) override {
    ++checks;
    if (throws_)
      throw std::runtime_error("connection refused");
    HealthRecord record;
    record.url = config.url;
    record.status = status_;
    record.status_code = status_ == HealthStatus::UP ? 200 : 503;
    record.response_time_ms = 42.0;
    record.last_check_ms = 1700000000000;
    return record;
  }

  std::atomic<int> checks{0};

private:
  HealthStatus status_;
  bool throws_;
};

// Checks of urls containing "slow" block until release() is called.
class GatedBackend : public IMonitorBackend {
public:
  HealthRecord check(const MonitorConfig &config) override {
    if (config.url.find("slow") != std::string::npos) {
      std::unique_lock<std::mutex> lock(mutex_);
      ++slow_checks_entered;
      cv_.wait(lock, [this] { return released_; });
    }
    HealthRecord record;
    record.url = config.url;
    record.status = HealthStatus::UP;
    record.status_code = 200;
    return record;
  }

  void release() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      released_ = true;
    }
    cv_.notify_all();
  }

  std::atomic<int> slow_checks_entered{0};

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool released_ = false;
};

template <typename Predicate> bool wait_until(Predicate predicate) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

} // namespace

class MonitorRegistryTest : public ::testing::Test {
protected:
  Config::MonitoringConfig cfg;
  std::mutex handled_mutex;
  std::vector<HealthRecord> handled;

  MonitorRegistry::FindingsHandler recorder() {
    return [this](const HealthRecord &record) {
      std::lock_guard<std::mutex> lock(handled_mutex);
      handled.push_back(record);
    };
  }

  size_t handled_count() {
    std::lock_guard<std::mutex> lock(handled_mutex);
    return handled.size();
  }

  HealthRecord first_handled() {
    std::lock_guard<std::mutex> lock(handled_mutex);
    return handled.front();
  }
};

TEST_F(MonitorRegistryTest, StartRunsImmediateCheckAndReportsIt) {
  auto backend = std::make_shared<FakeBackend>(HealthStatus::DOWN);
  MetricsRegistry metrics;
  MonitorRegistry registry(cfg, backend, recorder(), &metrics);

  MonitorConfig target;
  target.url = "https://example.com";
  target.check_interval_seconds = 5;
  EXPECT_EQ(registry.start(target), MonitorRegistry::StartResult::STARTED);

  ASSERT_TRUE(wait_until([&] { return handled_count() >= 1; }));
  EXPECT_EQ(first_handled().status, HealthStatus::DOWN);

  auto statuses = registry.list();
  ASSERT_EQ(statuses.size(), 1u);
  EXPECT_EQ(statuses[0].config.url, "https://example.com");
  // Raised to the configured minimum
  EXPECT_EQ(statuses[0].config.check_interval_seconds, 30u);
  ASSERT_TRUE(statuses[0].latest.has_value());
  EXPECT_EQ(*statuses[0].latest->status_code, 503);
  EXPECT_DOUBLE_EQ(metrics.active_monitors.Value(), 1.0);

  EXPECT_EQ(registry.stop("https://example.com"),
            MonitorRegistry::StopResult::STOPPED);
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_DOUBLE_EQ(metrics.active_monitors.Value(), 0.0);
}

TEST_F(MonitorRegistryTest, DuplicateStartIsReported) {
  auto backend = std::make_shared<FakeBackend>(HealthStatus::UP);
  MonitorRegistry registry(cfg, backend, recorder());

  MonitorConfig target;
  target.url = "example.com";
  EXPECT_EQ(registry.start(target), MonitorRegistry::StartResult::STARTED);
  target.url = "https://example.com";
  EXPECT_EQ(registry.start(target),
            MonitorRegistry::StartResult::ALREADY_MONITORING);
  EXPECT_EQ(registry.size(), 1u);
}

TEST_F(MonitorRegistryTest, StopUnknownTargetIsNotFound) {
  MonitorRegistry registry(cfg, std::make_shared<FakeBackend>(HealthStatus::UP),
                           recorder());
  EXPECT_EQ(registry.stop("https://nowhere.example"),
            MonitorRegistry::StopResult::NOT_FOUND);
}

TEST_F(MonitorRegistryTest, InvalidUrlIsRejected) {
  MonitorRegistry registry(cfg, std::make_shared<FakeBackend>(HealthStatus::UP),
                           recorder());
  MonitorConfig target;
  target.url = "ftp://example.com";
  EXPECT_THROW(registry.start(target), std::invalid_argument);
  target.url = "   ";
  EXPECT_THROW(registry.start(target), std::invalid_argument);
  EXPECT_EQ(registry.size(), 0u);
}

TEST_F(MonitorRegistryTest, NormalizeUrlPicksSchemeByHost) {
  EXPECT_EQ(MonitorRegistry::normalize_url("example.com"),
            "https://example.com");
  EXPECT_EQ(MonitorRegistry::normalize_url("localhost:8080/health"),
            "http://localhost:8080/health");
  EXPECT_EQ(MonitorRegistry::normalize_url("192.168.1.10:3000"),
            "http://192.168.1.10:3000");
  EXPECT_EQ(MonitorRegistry::normalize_url("localhost:443"),
            "https://localhost:443");
  EXPECT_EQ(MonitorRegistry::normalize_url("  http://shop.example/  "),
            "http://shop.example/");
}

TEST_F(MonitorRegistryTest, ThrowingBackendProducesErrorRecord) {
  auto backend = std::make_shared<FakeBackend>(HealthStatus::UP, true);
  MonitorRegistry registry(cfg, backend, recorder());

  MonitorConfig target;
  target.url = "https://broken.example";
  registry.start(target);

  ASSERT_TRUE(wait_until([&] { return handled_count() >= 1; }));
  const HealthRecord first = first_handled();
  EXPECT_EQ(first.status, HealthStatus::ERROR);
  ASSERT_EQ(first.errors.size(), 1u);
  EXPECT_EQ(first.errors[0], "connection refused");

  auto history = registry.history("https://broken.example");
  ASSERT_GE(history.size(), 1u);
  EXPECT_EQ(history[0].status, HealthStatus::ERROR);

  // A failed check keeps the task registered.
  EXPECT_TRUE(registry.is_monitoring("https://broken.example"));
  EXPECT_EQ(registry.size(), 1u);
}

TEST_F(MonitorRegistryTest, HealthHistoryKeepsOnlyNewestRecords) {
  cfg.health_history_size = 2;
  cfg.min_check_interval_seconds = 0;
  auto backend = std::make_shared<FakeBackend>(HealthStatus::UP);
  MonitorRegistry registry(cfg, backend, recorder());

  MonitorConfig target;
  target.url = "https://busy.example";
  target.check_interval_seconds = 0;
  registry.start(target);

  ASSERT_TRUE(wait_until([&] { return backend->checks.load() >= 5; }));
  EXPECT_EQ(registry.history("https://busy.example").size(), 2u);
  registry.stop("https://busy.example");
}

TEST_F(MonitorRegistryTest, SlowStopDoesNotBlockOtherTargets) {
  auto backend = std::make_shared<GatedBackend>();
  MonitorRegistry registry(cfg, backend, recorder());

  MonitorConfig slow;
  slow.url = "https://slow.example";
  registry.start(slow);
  ASSERT_TRUE(
      wait_until([&] { return backend->slow_checks_entered.load() >= 1; }));

  // Waits on the check that is still in flight.
  auto stopping = std::async(std::launch::async,
                             [&] { return registry.stop(slow.url); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  auto starting = std::async(std::launch::async, [&] {
    MonitorConfig other;
    other.url = "https://fast.example";
    return registry.start(other);
  });
  const auto start_state = starting.wait_for(std::chrono::seconds(2));
  // The stopping target still counts as monitored.
  const bool slow_still_listed = registry.is_monitoring(slow.url);

  backend->release();
  ASSERT_EQ(start_state, std::future_status::ready);
  EXPECT_EQ(starting.get(), MonitorRegistry::StartResult::STARTED);
  EXPECT_TRUE(slow_still_listed);
  EXPECT_EQ(stopping.get(), MonitorRegistry::StopResult::STOPPED);
  EXPECT_FALSE(registry.is_monitoring(slow.url));
  EXPECT_TRUE(registry.is_monitoring("https://fast.example"));
}

TEST_F(MonitorRegistryTest, StartingAStoppingTargetIsAlreadyMonitoring) {
  auto backend = std::make_shared<GatedBackend>();
  MonitorRegistry registry(cfg, backend, recorder());

  MonitorConfig slow;
  slow.url = "https://slow.example";
  registry.start(slow);
  ASSERT_TRUE(
      wait_until([&] { return backend->slow_checks_entered.load() >= 1; }));

  auto stopping = std::async(std::launch::async,
                             [&] { return registry.stop(slow.url); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  const auto second = registry.start(slow);
  backend->release();
  EXPECT_EQ(second, MonitorRegistry::StartResult::ALREADY_MONITORING);
  EXPECT_EQ(stopping.get(), MonitorRegistry::StopResult::STOPPED);
  EXPECT_EQ(registry.size(), 0u);
}

TEST_F(MonitorRegistryTest, StopAllCancelsEveryTask) {
  auto backend = std::make_shared<FakeBackend>(HealthStatus::UP);
  MonitorRegistry registry(cfg, backend, recorder());

  for (const char *url : {"https://a.example", "https://b.example"}) {
    MonitorConfig target;
    target.url = url;
    registry.start(target);
  }
  ASSERT_TRUE(wait_until([&] { return backend->checks.load() >= 2; }));

  registry.stop_all();
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_FALSE(registry.is_monitoring("https://a.example"));
}
