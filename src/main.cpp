#include "analysis/metrics_broadcaster.hpp"
#include "core/app_state.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "detection/pipeline_factory.hpp"
#include "io/db/mongo_manager.hpp"
#include "io/geo/enrichment_worker.hpp"
#include "io/geo/geolocator.hpp"
#include "io/log_sink/file_log_sink.hpp"
#include "io/log_sink/mongo_log_sink.hpp"
#include "io/web/web_server.hpp"
#include "monitoring/monitor_backend.hpp"
#include "monitoring/monitor_registry.hpp"
#include "response/incident_service.hpp"
#include "simulation/attack_simulator.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <unistd.h>

std::atomic<bool> g_shutdown_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
}

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);

  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  signal(SIGPIPE, SIG_IGN); // Dropped SSE clients must not kill the process

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  std::string config_file_to_load = "config.ini";
  if (argc > 1)
    config_file_to_load = argv[1];
  config_manager.load_configuration(config_file_to_load);

  auto current_config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(current_config->logging);

  LOG(LogLevel::INFO, LogComponent::CORE,
      current_config->service_name << " starting up...");
  LOG(LogLevel::DEBUG, LogComponent::CORE, "PID: " << getpid());

  AppState state(current_config);

  // --- Log Sinks ---
  const auto &sink_cfg = current_config->log_sink;
  std::shared_ptr<FileLogSink> file_sink;
  if (sink_cfg.file_enabled) {
    file_sink = std::make_shared<FileLogSink>(sink_cfg);
    state.log_sinks.add_sink(file_sink);
  }
  if (sink_cfg.mongo_enabled) {
    auto mongo_manager = std::make_shared<MongoManager>(sink_cfg);
    if (mongo_manager->is_initialized()) {
      if (mongo_manager->ping())
        mongo_manager->ensure_incident_indexes();
      state.log_sinks.add_sink(
          std::make_shared<MongoLogSink>(mongo_manager, sink_cfg));
    } else
      LOG(LogLevel::WARN, LogComponent::IO_SINK,
          "MongoDB sink disabled: connection pool unavailable.");
  }
  state.log_sinks.start();

  // --- Detection ---
  std::unique_ptr<DetectorPipeline> pipeline;
  try {
    pipeline = build_detector_pipeline(*current_config, state.intel,
                                       state.remote_model_breaker);
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Failed to build detector pipeline: " << e.what());
    return 1;
  }

  EnrichmentWorker enrichment(
      std::make_shared<HttpGeolocator>(current_config->geolocation),
      state.broadcaster, current_config->geolocation.queue_limit);
  enrichment.start();

  IncidentService incidents(state, *pipeline, &enrichment);

  // --- Background Services ---
  MetricsBroadcaster metrics_broadcaster(
      current_config->metrics, state.traffic, state.broadcaster,
      state.remote_model_breaker, &state.metrics);
  metrics_broadcaster.start();

  MonitorRegistry monitors(
      current_config->monitoring,
      std::make_shared<HttpMonitorBackend>(current_config->monitoring),
      [&incidents](const HealthRecord &record) {
        incidents.handle_health_record(record);
      },
      &state.metrics);

  AttackSimulator simulator(incidents, state.broadcaster);

  WebServer web_server(current_config->web_server, state, incidents, monitors,
                       simulator, file_sink);
  web_server.start();

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Service is running. Press Ctrl+C to shut down.");

  while (!g_shutdown_requested && web_server.is_running())
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

  // --- Shutdown Sequence ---
  LOG(LogLevel::INFO, LogComponent::CORE, "Shutting down...");
  web_server.stop();
  simulator.stop();
  monitors.stop_all();
  metrics_broadcaster.stop();
  enrichment.shutdown();
  state.log_sinks.shutdown();

  LOG(LogLevel::INFO, LogComponent::CORE, "Shutdown complete.");
  return 0;
}
