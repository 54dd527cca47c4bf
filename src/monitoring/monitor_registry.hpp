#ifndef MONITOR_REGISTRY_HPP
#define MONITOR_REGISTRY_HPP

#include "core/config.hpp"
#include "core/metrics_registry.hpp"
#include "monitoring/health_record.hpp"
#include "monitoring/monitor_backend.hpp"
#include "utils/cancellable_task.hpp"

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Supervises one background check task per monitored website. Targets are
// identified by their normalized url.
class MonitorRegistry {
public:
  enum class StartResult { STARTED, ALREADY_MONITORING };
  enum class StopResult { STOPPED, NOT_FOUND };

  using FindingsHandler = std::function<void(const HealthRecord &)>;

  struct MonitorStatus {
    MonitorConfig config;
    std::optional<HealthRecord> latest;
  };

  MonitorRegistry(const Config::MonitoringConfig &cfg,
                  std::shared_ptr<IMonitorBackend> backend,
                  FindingsHandler handler, MetricsRegistry *metrics = nullptr);
  ~MonitorRegistry();

  MonitorRegistry(const MonitorRegistry &) = delete;
  MonitorRegistry &operator=(const MonitorRegistry &) = delete;

  // Normalizes config.url and clamps the interval. Throws
  // std::invalid_argument for a url that is not http(s) with a host.
  StartResult start(MonitorConfig config);

  // Cancels the task, waits for it to finish, then forgets the target. The
  // target counts as monitored until then. No lock is held while waiting, so
  // a slow check only delays its own stop.
  StopResult stop(const std::string &target_id);
  void stop_all();

  std::vector<MonitorStatus> list() const;
  std::vector<HealthRecord> history(const std::string &target_id) const;
  bool is_monitoring(const std::string &target_id) const;
  size_t size() const;

  // Adds http:// for local hosts and https:// otherwise when the scheme is
  // missing. Throws std::invalid_argument when the result is not usable.
  static std::string normalize_url(const std::string &raw_url);

private:
  struct Registration {
    MonitorConfig config;
    std::deque<HealthRecord> health_history;
    std::unique_ptr<CancellableTask> task;
  };

  void run_monitor(CancellableTask &task,
                   std::shared_ptr<Registration> registration);
  HealthRecord run_check(const MonitorConfig &config);
  void update_gauge(size_t count);
  void forget(const std::string &target_id,
              const std::shared_ptr<Registration> &registration);

  const Config::MonitoringConfig config_;
  std::shared_ptr<IMonitorBackend> backend_;
  FindingsHandler handler_;
  MetricsRegistry *metrics_;

  // Guards the map and every registration's history. Never held across a
  // check or a join.
  mutable std::mutex registry_mutex_;
  std::map<std::string, std::shared_ptr<Registration>> registrations_;
};

#endif // MONITOR_REGISTRY_HPP
