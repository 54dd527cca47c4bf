#ifndef ATTACK_SIMULATOR_HPP
#define ATTACK_SIMULATOR_HPP

#include "core/event.hpp"
#include "io/broadcast/broadcaster.hpp"
#include "response/incident_service.hpp"
#include "utils/cancellable_task.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

// Replays a fixed set of attack templates through the incident path so the
// dashboard can be exercised without real traffic.
class AttackSimulator {
public:
  struct Options {
    size_t events_per_template = 2;
    size_t brute_force_attempts = 6;
    std::chrono::milliseconds flood_duration{3000};
    std::chrono::milliseconds flood_spacing{20};
    std::chrono::milliseconds min_pause{300};
    std::chrono::milliseconds max_pause{600};
  };

  // Applies the default Options.
  AttackSimulator(IncidentService &incidents, Broadcaster &broadcaster);
  AttackSimulator(IncidentService &incidents, Broadcaster &broadcaster,
                  Options options);
  ~AttackSimulator();

  AttackSimulator(const AttackSimulator &) = delete;
  AttackSimulator &operator=(const AttackSimulator &) = delete;

  // Starts a run in the background. Returns false while a run is in
  // progress.
  bool trigger();
  bool is_running() const;
  void stop();

  // Runs every template on the calling thread. Throws what the incident
  // path throws.
  void run_all(CancellableTask *task = nullptr);

  // Event batches in replay order, one source IP per batch.
  std::vector<std::vector<Event>> build_batches();

private:
  std::string random_source_ip();
  Event make_event(const std::string &event_type, const std::string &ip,
                   nlohmann::json payload);
  bool pause(CancellableTask *task, std::chrono::milliseconds duration);
  void broadcast_status(const std::string &status, const std::string &message);

  IncidentService &incidents_;
  Broadcaster &broadcaster_;
  const Options options_;

  std::mt19937 gen_;
  mutable std::mutex task_mutex_;
  std::unique_ptr<CancellableTask> task_;
};

#endif // ATTACK_SIMULATOR_HPP
