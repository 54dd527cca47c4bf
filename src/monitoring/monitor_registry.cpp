#include "monitor_registry.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <regex>
#include <stdexcept>

namespace {

bool looks_local(const std::string &authority) {
  static const std::regex ipv4_with_port(R"(^\d{1,3}(\.\d{1,3}){3}(:\d+)?$)");
  if (authority.rfind("localhost", 0) == 0 ||
      authority.rfind("127.0.0.1", 0) == 0 || authority.rfind("[::1]", 0) == 0)
    return true;
  return std::regex_match(authority, ipv4_with_port);
}

} // namespace

MonitorRegistry::MonitorRegistry(const Config::MonitoringConfig &cfg,
                                 std::shared_ptr<IMonitorBackend> backend,
                                 FindingsHandler handler,
                                 MetricsRegistry *metrics)
    : config_(cfg), backend_(std::move(backend)), handler_(std::move(handler)),
      metrics_(metrics) {}

MonitorRegistry::~MonitorRegistry() { stop_all(); }

std::string MonitorRegistry::normalize_url(const std::string &raw_url) {
  std::string url = Utils::trim_copy(raw_url);
  if (url.empty())
    throw std::invalid_argument("Invalid URL format: ''.");

  if (url.find("://") == std::string::npos) {
    std::string authority = url.substr(0, url.find_first_of("/?#"));
    bool explicit_tls_port =
        authority.size() > 4 &&
        authority.compare(authority.size() - 4, 4, ":443") == 0;
    const bool plain_http = looks_local(authority) && !explicit_tls_port;
    url = (plain_http ? "http://" : "https://") + url;
  }

  auto parsed = Utils::parse_url(url);
  if (!parsed || (parsed->scheme != "http" && parsed->scheme != "https") ||
      parsed->host.empty())
    throw std::invalid_argument("Invalid URL format: '" + raw_url + "'.");
  return url;
}

MonitorRegistry::StartResult MonitorRegistry::start(MonitorConfig config) {
  config.url = normalize_url(config.url);
  config.check_interval_seconds = std::max(config_.min_check_interval_seconds,
                                           config.check_interval_seconds);

  auto registration = std::make_shared<Registration>();
  registration->config = config;
  registration->task =
      std::make_unique<CancellableTask>("monitor:" + config.url);

  size_t count;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    // A target that is still stopping counts as present.
    if (registrations_.count(config.url)) {
      LOG(LogLevel::INFO, LogComponent::MONITOR,
          "Already monitoring " << config.url);
      return StartResult::ALREADY_MONITORING;
    }
    registrations_[config.url] = registration;
    count = registrations_.size();
    // Started under the lock so stop() never sees an unstarted task.
    registration->task->start([this, registration](CancellableTask &task) {
      run_monitor(task, registration);
    });
  }
  update_gauge(count);

  LOG(LogLevel::INFO, LogComponent::MONITOR,
      "Started monitoring " << config.url << " every "
                            << config.check_interval_seconds << "s");
  return StartResult::STARTED;
}

MonitorRegistry::StopResult
MonitorRegistry::stop(const std::string &target_id) {
  std::shared_ptr<Registration> registration;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = registrations_.find(target_id);
    if (it == registrations_.end())
      return StopResult::NOT_FOUND;
    registration = it->second;
  }

  // Concurrent stops of the same target both wait here; join is idempotent.
  registration->task->cancel();
  registration->task->join();
  forget(target_id, registration);

  LOG(LogLevel::INFO, LogComponent::MONITOR,
      "Stopped monitoring " << target_id);
  return StopResult::STOPPED;
}

void MonitorRegistry::stop_all() {
  std::vector<std::pair<std::string, std::shared_ptr<Registration>>> all;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto &[url, registration] : registrations_)
      all.emplace_back(url, registration);
  }

  // Cancel everything first so the tasks wind down in parallel
  for (const auto &entry : all)
    entry.second->task->cancel();
  for (const auto &entry : all) {
    entry.second->task->join();
    forget(entry.first, entry.second);
  }

  if (!all.empty())
    LOG(LogLevel::INFO, LogComponent::MONITOR,
        "Stopped all " << all.size() << " website monitor(s).");
}

void MonitorRegistry::forget(const std::string &target_id,
                             const std::shared_ptr<Registration> &registration) {
  size_t count;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    // Only erase our own entry, never one started after it was forgotten.
    auto it = registrations_.find(target_id);
    if (it != registrations_.end() && it->second == registration)
      registrations_.erase(it);
    count = registrations_.size();
  }
  update_gauge(count);
}

std::vector<MonitorRegistry::MonitorStatus> MonitorRegistry::list() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::vector<MonitorStatus> statuses;
  statuses.reserve(registrations_.size());
  for (const auto &[url, registration] : registrations_) {
    MonitorStatus status;
    status.config = registration->config;
    if (!registration->health_history.empty())
      status.latest = registration->health_history.back();
    statuses.push_back(std::move(status));
  }
  return statuses;
}

std::vector<HealthRecord>
MonitorRegistry::history(const std::string &target_id) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = registrations_.find(target_id);
  if (it == registrations_.end())
    return {};
  return {it->second->health_history.begin(), it->second->health_history.end()};
}

bool MonitorRegistry::is_monitoring(const std::string &target_id) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return registrations_.count(target_id) > 0;
}

size_t MonitorRegistry::size() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return registrations_.size();
}

HealthRecord MonitorRegistry::run_check(const MonitorConfig &config) {
  try {
    if (!backend_)
      throw std::runtime_error("No monitor backend configured");
    return backend_->check(config);
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::MONITOR,
        "Check of " << config.url << " failed: " << e.what());
    HealthRecord record;
    record.url = config.url;
    record.status = HealthStatus::ERROR;
    record.last_check_ms = Utils::get_current_time_ms();
    record.errors.push_back(e.what());
    return record;
  }
}

void MonitorRegistry::run_monitor(CancellableTask &task,
                                  std::shared_ptr<Registration> registration) {
  const MonitorConfig config = registration->config;
  const auto interval = std::chrono::seconds(config.check_interval_seconds);

  while (!task.is_cancelled()) {
    HealthRecord record = run_check(config);
    {
      std::lock_guard<std::mutex> lock(registry_mutex_);
      registration->health_history.push_back(record);
      while (registration->health_history.size() > config_.health_history_size)
        registration->health_history.pop_front();
    }

    if (task.is_cancelled())
      break;

    if (handler_) {
      try {
        handler_(record);
      } catch (const std::exception &e) {
        LOG(LogLevel::ERROR, LogComponent::MONITOR,
            "Findings handler failed for " << config.url << ": " << e.what());
      }
    }

    if (!task.wait_for(interval))
      break;
  }
  LOG(LogLevel::DEBUG, LogComponent::MONITOR,
      "Monitor task for " << config.url << " exited.");
}

void MonitorRegistry::update_gauge(size_t count) {
  if (metrics_)
    metrics_->active_monitors.Set(static_cast<double>(count));
}
