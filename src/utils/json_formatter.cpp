#include "json_formatter.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace {

std::optional<std::string> optional_string(const nlohmann::json &body,
                                           const char *key) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null())
    return std::nullopt;
  if (!it->is_string())
    throw std::invalid_argument(std::string("Field '") + key +
                                "' must be a string");
  return it->get<std::string>();
}

bool contains(const std::vector<std::string> &fields, const std::string &key) {
  return std::find(fields.begin(), fields.end(), key) != fields.end();
}

} // namespace

Event JsonFormatter::event_from_json(const nlohmann::json &body) {
  if (!body.is_object())
    throw std::invalid_argument("Event body must be a JSON object");

  Event event;
  auto type = optional_string(body, "event_type");
  if (!type || type->empty())
    throw std::invalid_argument("Field 'event_type' is required");
  event.event_type = *type;

  event.user_id = optional_string(body, "user_id");
  event.session_id = optional_string(body, "session_id");
  event.user_agent = optional_string(body, "user_agent");
  event.source_ip = optional_string(body, "source_ip").value_or("");

  auto data_it = body.find("data");
  if (data_it != body.end() && !data_it->is_null()) {
    if (!data_it->is_object())
      throw std::invalid_argument("Field 'data' must be an object");
    event.payload = *data_it;
  }

  auto headers_it = body.find("headers");
  if (headers_it != body.end() && !headers_it->is_null()) {
    if (!headers_it->is_object())
      throw std::invalid_argument("Field 'headers' must be an object");
    std::map<std::string, std::string> headers;
    for (const auto &item : headers_it->items()) {
      if (!item.value().is_string())
        throw std::invalid_argument("Header values must be strings");
      headers[item.key()] = item.value().get<std::string>();
    }
    event.headers = std::move(headers);
  }

  return event;
}

nlohmann::json
JsonFormatter::detection_to_json_object(const Detection &detection) {
  return {{"attack_type", detection.attack_type},
          {"severity", severity_to_string(detection.severity)},
          {"description", detection.description},
          {"evidence", detection.evidence}};
}

nlohmann::json
JsonFormatter::incident_to_json_object(const IncidentReport &report) {
  nlohmann::json j = detection_to_json_object(report.primary);

  j["incident_id"] = report.incident_id;
  j["timestamp"] = Utils::format_iso8601_ms(report.timestamp_ms);
  j["timestamp_ms"] = report.timestamp_ms;
  j["ip"] = report.source_ip;

  // The report severity is the risk severity, which may be escalated above
  // the primary detection's own severity.
  j["severity"] = severity_to_string(report.risk.severity);
  j["detection_severity"] = severity_to_string(report.primary.severity);
  j["risk_score"] = report.risk.score;
  j["risk_factors"] = report.risk.factors;
  j["detection_count"] = report.detection_count;

  j["event_type"] = report.event_type;
  j["user_id"] = report.user_id ? nlohmann::json(*report.user_id) : nullptr;
  j["data"] = report.event_data;

  if (report.location) {
    j["city"] = report.location->city;
    j["country"] = report.location->country;
    j["lat"] = report.location->lat;
    j["lon"] = report.location->lon;
  } else {
    j["city"] = "...";
    j["country"] = "...";
    j["lat"] = 0.0;
    j["lon"] = 0.0;
  }

  if (report.is_update)
    j["update"] = true;
  return j;
}

nlohmann::json
JsonFormatter::health_record_to_json_object(const HealthRecord &record) {
  nlohmann::json j;
  j["url"] = record.url;
  j["status"] = health_status_to_string(record.status);
  j["response_time"] = record.response_time_ms;
  j["last_check"] = Utils::format_iso8601_ms(record.last_check_ms);
  j["last_check_ms"] = record.last_check_ms;
  j["status_code"] =
      record.status_code ? nlohmann::json(*record.status_code) : nullptr;
  j["errors"] = record.errors;
  return j;
}

nlohmann::json
JsonFormatter::monitor_config_to_json_object(const MonitorConfig &config) {
  return {{"url", config.url},
          {"check_interval", config.check_interval_seconds},
          {"check_uptime", config.check_uptime},
          {"check_content", config.check_content},
          {"expected_keywords", config.expected_keywords},
          {"alert_on_performance", config.alert_on_performance}};
}

MonitorConfig
JsonFormatter::monitor_config_from_json(const nlohmann::json &body,
                                        uint32_t default_interval_seconds) {
  if (!body.is_object())
    throw std::invalid_argument("Monitor body must be a JSON object");

  MonitorConfig config;
  auto url = optional_string(body, "url");
  if (!url || Utils::trim_copy(*url).empty())
    throw std::invalid_argument("Field 'url' is required");
  config.url = Utils::trim_copy(*url);

  config.check_interval_seconds = default_interval_seconds;
  auto interval_it = body.find("check_interval");
  if (interval_it != body.end() && !interval_it->is_null()) {
    if (!interval_it->is_number_integer() || interval_it->get<int64_t>() < 0)
      throw std::invalid_argument(
          "Field 'check_interval' must be a non-negative integer");
    config.check_interval_seconds =
        static_cast<uint32_t>(interval_it->get<int64_t>());
  }

  config.check_uptime = body.value("check_uptime", config.check_uptime);
  config.check_content = body.value("check_content", config.check_content);
  config.alert_on_performance =
      body.value("alert_on_performance", config.alert_on_performance);
  auto keywords_it = body.find("expected_keywords");
  if (keywords_it != body.end() && keywords_it->is_array())
    for (const auto &keyword : *keywords_it)
      if (keyword.is_string())
        config.expected_keywords.push_back(keyword.get<std::string>());

  return config;
}

nlohmann::json JsonFormatter::make_envelope(const std::string &type,
                                            const nlohmann::json &body) {
  nlohmann::json envelope = body.is_object() ? body : nlohmann::json::object();
  envelope["type"] = type;
  return envelope;
}

nlohmann::json JsonFormatter::mask_sensitive_fields(
    const nlohmann::json &data, const std::vector<std::string> &pii_fields,
    const std::vector<std::string> &payment_fields) {
  if (!data.is_object())
    return data;

  nlohmann::json masked = data;
  for (auto &item : masked.items()) {
    const std::string &key = item.key();
    auto &value = item.value();

    if (contains(pii_fields, key)) {
      value = "[MASKED]";
    } else if (key == "card_number" && value.is_string()) {
      const auto card = value.get<std::string>();
      if (card.size() > 4)
        value = "XXXX-XXXX-XXXX-" + card.substr(card.size() - 4);
    } else if (contains(payment_fields, key) && value.is_string()) {
      const auto text = value.get<std::string>();
      if (text.size() > 8)
        value = text.substr(0, 4) + "...[MASKED]";
    }
  }
  return masked;
}
