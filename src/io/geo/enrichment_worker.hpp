#ifndef ENRICHMENT_WORKER_HPP
#define ENRICHMENT_WORKER_HPP

#include "core/incident.hpp"
#include "io/broadcast/broadcaster.hpp"
#include "io/geo/geolocator.hpp"
#include "utils/thread_safe_queue.hpp"

#include <memory>
#include <thread>

// Resolves the location of freshly broadcast incidents and re-broadcasts them
// as updates carrying the same incident_id.
class EnrichmentWorker {
public:
  // At most queue_limit incidents wait for a lookup; later ones go out
  // without a location update.
  EnrichmentWorker(std::shared_ptr<IGeolocator> geolocator,
                   Broadcaster &broadcaster, size_t queue_limit);
  ~EnrichmentWorker();

  EnrichmentWorker(const EnrichmentWorker &) = delete;
  EnrichmentWorker &operator=(const EnrichmentWorker &) = delete;

  void start();
  void shutdown();

  // Monitor-sourced incidents are ignored. Returns true when queued.
  bool submit(const IncidentReport &report);

  // The enriched copy of report.
  IncidentReport enrich(const IncidentReport &report);

private:
  void worker_loop();

  std::shared_ptr<IGeolocator> geolocator_;
  Broadcaster &broadcaster_;
  ThreadSafeQueue<IncidentReport> queue_;
  std::thread worker_thread_;
};

#endif // ENRICHMENT_WORKER_HPP
