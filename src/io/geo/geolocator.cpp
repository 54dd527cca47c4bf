#include "geolocator.hpp"
#include "core/logger.hpp"

#include <httplib.h>

namespace {

template <typename Client>
httplib::Result fetch(Client &client, uint32_t timeout_seconds,
                      const std::string &path) {
  client.set_connection_timeout(timeout_seconds);
  client.set_read_timeout(timeout_seconds);
  return client.Get(path);
}

} // namespace

HttpGeolocator::HttpGeolocator(const Config::GeolocationConfig &cfg)
    : config_(cfg), service_(Utils::parse_url(cfg.service_url)) {
  if (config_.enabled && !service_)
    LOG(LogLevel::WARN, LogComponent::IO_GEO,
        "Invalid geolocation service url '" << cfg.service_url
                                            << "', lookups disabled.");
}

GeoLocation HttpGeolocator::local_location() {
  GeoLocation location;
  location.city = "Local";
  location.country = "Local";
  return location;
}

GeoLocation HttpGeolocator::parse_response(const std::string &body) {
  GeoLocation location;
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object())
    return location;
  if (parsed.value("status", "success") != "success")
    return location;

  auto text_field = [&parsed](const char *key) {
    auto it = parsed.find(key);
    if (it != parsed.end() && it->is_string() && !it->get<std::string>().empty())
      return it->get<std::string>();
    return std::string("Unknown");
  };
  auto number_field = [&parsed](const char *key) {
    auto it = parsed.find(key);
    return it != parsed.end() && it->is_number() ? it->get<double>() : 0.0;
  };

  location.city = text_field("city");
  location.country = text_field("country");
  location.lat = number_field("lat");
  location.lon = number_field("lon");
  return location;
}

GeoLocation HttpGeolocator::locate(const std::string &ip) {
  if (Utils::is_loopback_address(ip))
    return local_location();

  if (!config_.enabled || !service_)
    return GeoLocation{};

  const std::string path = service_->path + ip;
  httplib::Result res = [&]() {
    if (service_->scheme == "https") {
      httplib::SSLClient client(service_->host,
                                service_->port > 0 ? service_->port : 443);
      return fetch(client, config_.timeout_seconds, path);
    }
    httplib::Client client(service_->host,
                           service_->port > 0 ? service_->port : 80);
    return fetch(client, config_.timeout_seconds, path);
  }();

  if (!res || res->status != 200) {
    LOG(LogLevel::WARN, LogComponent::IO_GEO,
        "IP Geolocation for " << ip << " failed"
                              << (res ? " | Status: " +
                                            std::to_string(res->status)
                                      : " | Error: " +
                                            httplib::to_string(res.error())));
    return GeoLocation{};
  }
  return parse_response(res->body);
}
