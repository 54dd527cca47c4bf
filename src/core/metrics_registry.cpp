#include "metrics_registry.hpp"

#include <prometheus/text_serializer.h>

#include <sstream>

namespace {

prometheus::Counter &make_counter(prometheus::Registry &registry,
                                  const std::string &name,
                                  const std::string &help) {
  return prometheus::BuildCounter().Name(name).Help(help).Register(registry).Add(
      {});
}

prometheus::Gauge &make_gauge(prometheus::Registry &registry,
                              const std::string &name,
                              const std::string &help) {
  return prometheus::BuildGauge().Name(name).Help(help).Register(registry).Add(
      {});
}

} // namespace

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()),
      events_received(make_counter(*registry_,
                                   "threat_guard_events_received_total",
                                   "Events accepted by /log_event")),
      threats_detected(make_counter(*registry_,
                                    "threat_guard_threats_detected_total",
                                    "Events that produced at least one "
                                    "detection")),
      ip_blocks_applied(make_counter(*registry_,
                                     "threat_guard_ip_blocks_applied_total",
                                     "Temporary IP blocks applied")),
      broadcast_delivery_failures(make_counter(
          *registry_,
          "threat_guard_broadcast_delivery_failures_total",
          "Observers dropped after a failed delivery")),
      breaker_open(make_gauge(*registry_,
                              "threat_guard_breaker_open",
                              "1 while the remote model circuit is open")),
      connected_observers(make_gauge(*registry_,
                                     "threat_guard_connected_observers",
                                     "Currently connected event observers")),
      active_monitors(make_gauge(*registry_,
                                 "threat_guard_active_monitors",
                                 "Websites currently being monitored")) {}

std::string MetricsRegistry::serialize() const {
  prometheus::TextSerializer serializer;
  std::ostringstream out;
  serializer.Serialize(out, registry_->Collect());
  return out.str();
}
