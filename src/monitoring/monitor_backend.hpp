#ifndef MONITOR_BACKEND_HPP
#define MONITOR_BACKEND_HPP

#include "core/config.hpp"
#include "monitoring/health_record.hpp"

// Performs one health check. May throw; the monitor task then records an
// "error" HealthRecord and keeps its schedule.
class IMonitorBackend {
public:
  virtual ~IMonitorBackend() = default;
  virtual HealthRecord check(const MonitorConfig &config) = 0;
};

class HttpMonitorBackend : public IMonitorBackend {
public:
  explicit HttpMonitorBackend(const Config::MonitoringConfig &cfg)
      : config_(cfg) {}
  HealthRecord check(const MonitorConfig &config) override;

private:
  const Config::MonitoringConfig config_;
};

#endif // MONITOR_BACKEND_HPP
