#ifndef THRESHOLD_DETECTORS_HPP
#define THRESHOLD_DETECTORS_HPP

#include "core/config.hpp"
#include "detection/detector.hpp"
#include "detection/keyed_event_counter.hpp"

#include <cstdint>
#include <functional>

using TimeSource = std::function<uint64_t()>;

// Repeated "payment_failure" events from one source inside the window.
class CardTestingDetector : public IDetector {
public:
  CardTestingDetector(const Config::DetectionConfig &cfg, TimeSource now);
  std::optional<Detection> classify(const Event &event) override;
  const char *get_name() const override { return "card_testing"; }

private:
  const size_t threshold_;
  const uint64_t window_seconds_;
  KeyedEventCounter counter_;
  TimeSource now_;
};

// Repeated "login_failure" events for one account (or source when the
// account is unknown).
class BruteForceDetector : public IDetector {
public:
  BruteForceDetector(const Config::DetectionConfig &cfg, TimeSource now);
  std::optional<Detection> classify(const Event &event) override;
  const char *get_name() const override { return "brute_force"; }

private:
  const size_t threshold_;
  const uint64_t window_seconds_;
  KeyedEventCounter counter_;
  TimeSource now_;
};

// Any event type: too many events from one source inside the window.
class RequestFloodDetector : public IDetector {
public:
  RequestFloodDetector(const Config::DetectionConfig &cfg, TimeSource now);
  std::optional<Detection> classify(const Event &event) override;
  const char *get_name() const override { return "request_flood"; }

private:
  const size_t max_requests_;
  const uint64_t window_seconds_;
  KeyedEventCounter counter_;
  TimeSource now_;
};

#endif // THRESHOLD_DETECTORS_HPP
