#ifndef DETECTOR_HPP
#define DETECTOR_HPP

#include "core/event.hpp"

#include <optional>

// One stage of the detector pipeline. classify() may throw; the pipeline
// isolates the failure and treats it as no detection.
class IDetector {
public:
  virtual ~IDetector() = default;
  virtual std::optional<Detection> classify(const Event &event) = 0;
  virtual const char *get_name() const = 0;
};

#endif // DETECTOR_HPP
