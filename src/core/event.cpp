#include "event.hpp"

#include <algorithm>
#include <cctype>

std::string severity_to_string(Severity severity) {
  switch (severity) {
  case Severity::LOW:
    return "LOW";
  case Severity::MEDIUM:
    return "MEDIUM";
  case Severity::HIGH:
    return "HIGH";
  case Severity::CRITICAL:
    return "CRITICAL";
  }
  return "LOW";
}

std::optional<Severity> severity_from_string(const std::string &text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "LOW")
    return Severity::LOW;
  if (upper == "MEDIUM")
    return Severity::MEDIUM;
  if (upper == "HIGH")
    return Severity::HIGH;
  if (upper == "CRITICAL")
    return Severity::CRITICAL;
  return std::nullopt;
}
