#ifndef EVENT_HPP
#define EVENT_HPP

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>

// Severity levels in ascending order of weight
enum class Severity { LOW = 0, MEDIUM = 1, HIGH = 2, CRITICAL = 3 };

std::string severity_to_string(Severity severity);
std::optional<Severity> severity_from_string(const std::string &text);

// A security-relevant event as received from a client. Immutable once built.
struct Event {
  std::string event_type;
  std::optional<std::string> user_id;
  nlohmann::json payload = nlohmann::json::object();
  std::string source_ip;
  std::optional<std::map<std::string, std::string>> headers;
  std::optional<std::string> session_id;
  std::optional<std::string> user_agent;
};

// The result of one detector stage.
struct Detection {
  std::string attack_type;
  Severity severity = Severity::LOW;
  std::string description;
  nlohmann::json evidence = nlohmann::json::object();
};

#endif // EVENT_HPP
