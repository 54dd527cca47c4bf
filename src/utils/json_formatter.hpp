#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "core/event.hpp"
#include "core/incident.hpp"
#include "monitoring/health_record.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace JsonFormatter {

// Builds an Event from an inbound request body. Throws std::invalid_argument
// when required fields are missing or have the wrong type.
Event event_from_json(const nlohmann::json &body);

nlohmann::json detection_to_json_object(const Detection &detection);
nlohmann::json incident_to_json_object(const IncidentReport &report);
nlohmann::json health_record_to_json_object(const HealthRecord &record);
nlohmann::json monitor_config_to_json_object(const MonitorConfig &config);

// Throws std::invalid_argument when the url is missing.
MonitorConfig monitor_config_from_json(const nlohmann::json &body,
                                       uint32_t default_interval_seconds);

// Broadcast envelope: {"type": type, ...fields of body}.
nlohmann::json make_envelope(const std::string &type,
                             const nlohmann::json &body);

// Masks personal and payment fields at the top level of an object.
nlohmann::json mask_sensitive_fields(
    const nlohmann::json &data, const std::vector<std::string> &pii_fields,
    const std::vector<std::string> &payment_fields);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
