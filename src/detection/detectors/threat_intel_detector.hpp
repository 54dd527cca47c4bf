#ifndef THREAT_INTEL_DETECTOR_HPP
#define THREAT_INTEL_DETECTOR_HPP

#include "detection/detector.hpp"
#include "io/threat_intel/intel_manager.hpp"

#include <memory>

// Flags sources present on the threat-intelligence blacklist.
class ThreatIntelDetector : public IDetector {
public:
  explicit ThreatIntelDetector(std::shared_ptr<const IntelManager> intel)
      : intel_(std::move(intel)) {}

  std::optional<Detection> classify(const Event &event) override;
  const char *get_name() const override { return "threat_intel"; }

private:
  std::shared_ptr<const IntelManager> intel_;
};

#endif // THREAT_INTEL_DETECTOR_HPP
