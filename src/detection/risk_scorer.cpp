#include "risk_scorer.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <stdexcept>

double RiskScorer::weight_of(Severity severity) const {
  switch (severity) {
  case Severity::LOW:
    return config_.weight_low;
  case Severity::MEDIUM:
    return config_.weight_medium;
  case Severity::HIGH:
    return config_.weight_high;
  case Severity::CRITICAL:
    return config_.weight_critical;
  }
  return 0.0;
}

size_t RiskScorer::primary_index(const std::vector<Detection> &detections) const {
  if (detections.empty())
    throw std::invalid_argument("Cannot pick a primary from no detections");

  size_t best = 0;
  for (size_t i = 1; i < detections.size(); ++i)
    if (weight_of(detections[i].severity) > weight_of(detections[best].severity))
      best = i;
  return best;
}

RiskScore RiskScorer::score(const Event &event,
                            const std::vector<Detection> &detections) const {
  if (detections.empty())
    throw std::invalid_argument("Risk scoring requires at least one detection");

  const Detection &primary = detections[primary_index(detections)];
  const size_t n = detections.size();

  RiskScore risk;
  risk.score = std::min(1.0, weight_of(primary.severity) +
                                 config_.multi_detection_bonus *
                                     static_cast<double>(n - 1));
  risk.severity = primary.severity;

  for (const auto &detection : detections)
    risk.factors.push_back(detection.attack_type + " (" +
                           severity_to_string(detection.severity) + ")");
  if (n > 1)
    risk.factors.push_back("Correlated detections: " + std::to_string(n));

  if (risk.score >= config_.critical_upgrade_threshold &&
      risk.severity != Severity::CRITICAL) {
    risk.severity = Severity::CRITICAL;
    risk.factors.push_back("Escalated to CRITICAL by combined score");
  }

  LOG(LogLevel::DEBUG, LogComponent::RISK,
      "Scored " << event.event_type << " from " << event.source_ip << ": "
                << risk.score << " (" << severity_to_string(risk.severity)
                << ")");
  return risk;
}
