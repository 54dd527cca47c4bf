#include "remote_model_detector.hpp"
#include "core/logger.hpp"

#include <httplib.h>

#include <stdexcept>

namespace {

constexpr const char *DEFAULT_MODEL_ATTACK_TYPE = "AI_DETECTED_ANOMALY";

template <typename Client>
httplib::Result post_prompt(Client &client, const Config::RemoteModelConfig &cfg,
                            const std::string &path, const std::string &body) {
  const time_t seconds = cfg.timeout_ms / 1000;
  const time_t usec = (cfg.timeout_ms % 1000) * 1000;
  client.set_connection_timeout(seconds, usec);
  client.set_read_timeout(seconds, usec);
  client.set_write_timeout(seconds, usec);
  return client.Post(path, body, "application/json");
}

httplib::Result send_prompt(const Utils::ParsedUrl &endpoint,
                            const Config::RemoteModelConfig &cfg,
                            const std::string &body) {
  if (endpoint.scheme == "https") {
    httplib::SSLClient client(endpoint.host,
                              endpoint.port > 0 ? endpoint.port : 443);
    return post_prompt(client, cfg, endpoint.path, body);
  }
  httplib::Client client(endpoint.host, endpoint.port > 0 ? endpoint.port : 80);
  return post_prompt(client, cfg, endpoint.path, body);
}

} // namespace

RemoteModelDetector::RemoteModelDetector(const Config::RemoteModelConfig &cfg)
    : config_(cfg) {
  auto parsed = Utils::parse_url(cfg.url);
  if (!parsed || (parsed->scheme != "http" && parsed->scheme != "https"))
    throw std::invalid_argument("Invalid remote model url: " + cfg.url);
  endpoint_ = *parsed;
}

std::string RemoteModelDetector::build_prompt(const Event &event) {
  nlohmann::json context = {{"event_type", event.event_type},
                            {"source_ip", event.source_ip},
                            {"data", event.payload}};
  if (event.user_id)
    context["user_id"] = *event.user_id;
  if (event.user_agent)
    context["user_agent"] = *event.user_agent;

  return "You are a security analyst. Decide whether the following event is "
         "malicious. Answer only with JSON of the form {\"is_threat\": bool, "
         "\"attack_type\": string, \"severity\": "
         "\"LOW|MEDIUM|HIGH|CRITICAL\", \"reason\": string}.\nEvent: " +
         context.dump();
}

std::optional<Detection>
RemoteModelDetector::parse_verdict(const std::string &body) {
  nlohmann::json verdict;
  try {
    verdict = nlohmann::json::parse(body);
    auto response_it = verdict.find("response");
    if (response_it != verdict.end() && response_it->is_string())
      verdict = nlohmann::json::parse(response_it->get<std::string>());
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(std::string("Unparseable model answer: ") +
                             e.what());
  }

  if (!verdict.is_object() || !verdict.contains("is_threat") ||
      !verdict["is_threat"].is_boolean())
    throw std::runtime_error("Model answer has no boolean 'is_threat'");

  if (!verdict["is_threat"].get<bool>())
    return std::nullopt;

  Detection detection;
  detection.attack_type = verdict.value("attack_type", "");
  if (detection.attack_type.empty())
    detection.attack_type = DEFAULT_MODEL_ATTACK_TYPE;
  detection.severity =
      severity_from_string(verdict.value("severity", "MEDIUM"))
          .value_or(Severity::MEDIUM);
  detection.description = verdict.value("reason", "Flagged by remote model");
  detection.evidence = {{"source", "remote_model"}};
  return detection;
}

std::optional<Detection> RemoteModelDetector::classify(const Event &event) {
  nlohmann::json request = {{"model", config_.model},
                            {"prompt", build_prompt(event)},
                            {"stream", false},
                            {"format", "json"}};
  auto res = send_prompt(endpoint_, config_, request.dump());

  if (!res)
    throw std::runtime_error("Remote model unreachable: " +
                             httplib::to_string(res.error()));
  if (res->status != 200)
    throw std::runtime_error("Remote model returned HTTP " +
                             std::to_string(res->status));

  auto detection = parse_verdict(res->body);
  LOG(LogLevel::DEBUG, LogComponent::DETECTOR,
      "Remote model verdict for " << event.source_ip << ": "
                                  << (detection ? detection->attack_type
                                                : std::string("benign")));
  return detection;
}
