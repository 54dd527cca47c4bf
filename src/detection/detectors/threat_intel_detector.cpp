#include "threat_intel_detector.hpp"

std::optional<Detection> ThreatIntelDetector::classify(const Event &event) {
  if (!intel_ || event.source_ip.empty() ||
      !intel_->is_blacklisted(event.source_ip))
    return std::nullopt;

  Detection detection;
  detection.attack_type = "THREAT_INTEL_MATCH";
  detection.severity = Severity::HIGH;
  detection.description = "Source IP is listed in a threat intelligence feed";
  detection.evidence = {{"ip", event.source_ip}};
  return detection;
}
