#include "monitor_backend.hpp"
#include "monitoring/health_classifier.hpp"
#include "utils/utils.hpp"

#include <httplib.h>

#include <chrono>
#include <stdexcept>

namespace {

template <typename Client>
HealthClassifier::CheckObservation observe(Client &client, uint32_t timeout,
                                           const std::string &path) {
  client.set_connection_timeout(timeout);
  client.set_read_timeout(timeout);
  client.set_follow_location(true);

  HealthClassifier::CheckObservation observation;
  auto started = std::chrono::steady_clock::now();
  auto res = client.Get(path);
  observation.response_time_ms =
      std::chrono::duration<double, std::milli>(
          std::chrono::steady_clock::now() - started)
          .count();

  if (!res) {
    observation.transport_error = httplib::to_string(res.error());
    return observation;
  }
  observation.status_code = res->status;
  observation.body = std::move(res->body);
  return observation;
}

} // namespace

HealthRecord HttpMonitorBackend::check(const MonitorConfig &config) {
  auto url = Utils::parse_url(config.url);
  if (!url)
    throw std::invalid_argument("Unparseable monitor url: " + config.url);

  HealthClassifier::CheckObservation observation;
  if (url->scheme == "https") {
    httplib::SSLClient client(url->host, url->port > 0 ? url->port : 443);
    observation = observe(client, config_.request_timeout_seconds, url->path);
  } else {
    httplib::Client client(url->host, url->port > 0 ? url->port : 80);
    observation = observe(client, config_.request_timeout_seconds, url->path);
  }

  return HealthClassifier::classify(config, observation, config_,
                                    Utils::get_current_time_ms());
}
