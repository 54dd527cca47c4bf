#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "core/app_state.hpp"
#include "io/broadcast/sse_channel.hpp"
#include "io/log_sink/file_log_sink.hpp"
#include "monitoring/monitor_registry.hpp"
#include "response/incident_service.hpp"
#include "simulation/attack_simulator.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

class WebServer {
public:
  // attack_log may be null when the file sink is disabled; /attack_log then
  // returns an empty list.
  WebServer(const Config::WebServerConfig &cfg, AppState &state,
            IncidentService &incidents, MonitorRegistry &monitors,
            AttackSimulator &simulator,
            std::shared_ptr<FileLogSink> attack_log);
  ~WebServer();

  WebServer(const WebServer &) = delete;
  WebServer &operator=(const WebServer &) = delete;

  void start();
  void stop();
  bool is_running() const { return running_.load(); }

  // Source IP of an event: the body field, then X-Forwarded-For, then the
  // peer address.
  static std::string resolve_source_ip(const std::string &body_ip,
                                       const std::string &forwarded_for,
                                       const std::string &remote_addr);

private:
  void register_routes();
  void run();

  void handle_log_event(const httplib::Request &req, httplib::Response &res);
  void handle_events(const httplib::Request &req, httplib::Response &res);
  void handle_add_monitor(const httplib::Request &req, httplib::Response &res);
  void handle_remove_monitor(const httplib::Request &req,
                             httplib::Response &res);
  void handle_list_monitors(httplib::Response &res);
  void handle_attack_log(httplib::Response &res);

  const Config::WebServerConfig config_;
  AppState &state_;
  IncidentService &incidents_;
  MonitorRegistry &monitors_;
  AttackSimulator &simulator_;
  std::shared_ptr<FileLogSink> attack_log_;

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::atomic<bool> running_{false};

  std::mutex streams_mutex_;
  std::unordered_set<std::shared_ptr<SseChannel>> open_streams_;
};

#endif // WEB_SERVER_HPP
