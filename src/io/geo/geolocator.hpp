#ifndef GEOLOCATOR_HPP
#define GEOLOCATOR_HPP

#include "core/config.hpp"
#include "core/incident.hpp"
#include "utils/utils.hpp"

#include <string>

class IGeolocator {
public:
  virtual ~IGeolocator() = default;
  // Never throws; unknown locations come back as "Unknown".
  virtual GeoLocation locate(const std::string &ip) = 0;
};

// Looks addresses up against an ip-api.com style JSON service
// (GET <service_url><ip>).
class HttpGeolocator : public IGeolocator {
public:
  explicit HttpGeolocator(const Config::GeolocationConfig &cfg);
  GeoLocation locate(const std::string &ip) override;

  static GeoLocation local_location();
  static GeoLocation parse_response(const std::string &body);

private:
  const Config::GeolocationConfig config_;
  std::optional<Utils::ParsedUrl> service_;
};

#endif // GEOLOCATOR_HPP
