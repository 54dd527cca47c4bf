#ifndef REMOTE_MODEL_DETECTOR_HPP
#define REMOTE_MODEL_DETECTOR_HPP

#include "core/config.hpp"
#include "detection/detector.hpp"
#include "utils/utils.hpp"

#include <string>

// Asks a remote language model for a verdict on the event. This is the slow
// and unreliable stage; the pipeline always calls it through the circuit
// breaker. Transport errors and unusable answers throw std::runtime_error so
// the breaker counts them.
class RemoteModelDetector : public IDetector {
public:
  explicit RemoteModelDetector(const Config::RemoteModelConfig &cfg);

  std::optional<Detection> classify(const Event &event) override;
  const char *get_name() const override { return "remote_model"; }

  static std::string build_prompt(const Event &event);

  // Accepts either the verdict object itself or a generate-style envelope
  // whose "response" field holds the verdict as a JSON string.
  static std::optional<Detection> parse_verdict(const std::string &body);

private:
  const Config::RemoteModelConfig config_;
  Utils::ParsedUrl endpoint_;
};

#endif // REMOTE_MODEL_DETECTOR_HPP
