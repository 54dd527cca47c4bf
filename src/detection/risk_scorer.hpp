#ifndef RISK_SCORER_HPP
#define RISK_SCORER_HPP

#include "core/config.hpp"
#include "core/incident.hpp"

#include <vector>

class RiskScorer {
public:
  explicit RiskScorer(const Config::RiskScoringConfig &cfg) : config_(cfg) {}

  // detections must be non-empty; throws std::invalid_argument otherwise.
  RiskScore score(const Event &event,
                  const std::vector<Detection> &detections) const;

  // Index of the highest-weighted detection, first one on ties.
  size_t primary_index(const std::vector<Detection> &detections) const;

  double weight_of(Severity severity) const;

private:
  const Config::RiskScoringConfig config_;
};

#endif // RISK_SCORER_HPP
