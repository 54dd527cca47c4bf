#include "web_server.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <chrono>

namespace {

constexpr const char *JSON_CONTENT = "application/json";

void send_json(httplib::Response &res, int status, const nlohmann::json &body) {
  res.status = status;
  res.set_content(body.dump(), JSON_CONTENT);
}

void send_error(httplib::Response &res, int status, const std::string &detail) {
  send_json(res, status, {{"detail", detail}});
}

} // namespace

WebServer::WebServer(const Config::WebServerConfig &cfg, AppState &state,
                     IncidentService &incidents, MonitorRegistry &monitors,
                     AttackSimulator &simulator,
                     std::shared_ptr<FileLogSink> attack_log)
    : config_(cfg), state_(state), incidents_(incidents), monitors_(monitors),
      simulator_(simulator), attack_log_(std::move(attack_log)) {
  server_ = std::make_unique<httplib::Server>();

  const size_t workers = config_.worker_threads;
  server_->new_task_queue = [workers] {
    return new httplib::ThreadPool(workers);
  };

  register_routes();
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server initialized for " << config_.host << ":" << config_.port
                                    << " with " << workers << " workers");
}

WebServer::~WebServer() { stop(); }

std::string WebServer::resolve_source_ip(const std::string &body_ip,
                                         const std::string &forwarded_for,
                                         const std::string &remote_addr) {
  if (!Utils::trim_copy(body_ip).empty())
    return Utils::trim_copy(body_ip);

  // X-Forwarded-For may carry a proxy chain; the client is the first hop
  auto hops = Utils::split_string(forwarded_for, ',');
  if (!hops.empty())
    return hops.front();

  return remote_addr.empty() ? "unknown" : remote_addr;
}

void WebServer::register_routes() {
  server_->Post("/log_event",
                [this](const httplib::Request &req, httplib::Response &res) {
                  handle_log_event(req, res);
                });

  server_->Get("/events",
               [this](const httplib::Request &req, httplib::Response &res) {
                 handle_events(req, res);
               });

  server_->Post("/monitor/website",
                [this](const httplib::Request &req, httplib::Response &res) {
                  handle_add_monitor(req, res);
                });

  server_->Delete(R"(/monitor/website/(.+))",
                  [this](const httplib::Request &req, httplib::Response &res) {
                    handle_remove_monitor(req, res);
                  });

  server_->Get("/monitor/websites",
               [this](const httplib::Request &, httplib::Response &res) {
                 handle_list_monitors(res);
               });

  server_->Get("/analytics", [this](const httplib::Request &,
                                    httplib::Response &res) {
    IncidentHistory::AnalyticsInputs inputs;
    inputs.now_ms = Utils::get_current_time_ms();
    inputs.threat_intel_ip_count = state_.intel->blacklist_size();
    inputs.rate_limited_ip_count = state_.rate_limiter.active_block_count();
    send_json(res, 200, state_.history.build_analytics(inputs));
  });

  server_->Get("/attack_log",
               [this](const httplib::Request &, httplib::Response &res) {
                 handle_attack_log(res);
               });

  server_->Post("/run_simulation",
                [this](const httplib::Request &req, httplib::Response &res) {
                  LOG(LogLevel::INFO, LogComponent::IO_WEB,
                      "Simulation requested by " << req.remote_addr);
                  if (!simulator_.trigger()) {
                    send_error(res, 409, "A simulation is already running.");
                    return;
                  }
                  send_json(res, 202,
                            {{"message",
                              "Attack simulation scheduled successfully."}});
                });

  server_->Get("/health", [](const httplib::Request &, httplib::Response &res) {
    send_json(res, 200, {{"status", "ok"}});
  });

  server_->Get("/metrics", [this](const httplib::Request &req,
                                  httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
        "Received request for /metrics from " << req.remote_addr);
    res.set_content(state_.metrics.serialize(), "text/plain; version=0.0.4");
  });
}

void WebServer::handle_log_event(const httplib::Request &req,
                                 httplib::Response &res) {
  Event event;
  try {
    event = JsonFormatter::event_from_json(nlohmann::json::parse(req.body));
  } catch (const nlohmann::json::parse_error &e) {
    send_error(res, 400, std::string("Malformed JSON body: ") + e.what());
    return;
  } catch (const std::invalid_argument &e) {
    send_error(res, 400, e.what());
    return;
  }

  event.source_ip =
      resolve_source_ip(event.source_ip,
                        req.get_header_value("X-Forwarded-For"),
                        req.remote_addr);
  LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
      "Event received: " << event.event_type << " from IP: "
                         << event.source_ip);

  auto result = incidents_.submit_event(event);
  switch (result.outcome) {
  case IncidentService::Outcome::NO_THREAT:
    send_json(res, 200, {{"status", "no_threat"}});
    break;
  case IncidentService::Outcome::THREAT_DETECTED:
    send_json(res, 200,
              {{"status", "threat_detected"},
               {"details",
                JsonFormatter::incident_to_json_object(*result.report)}});
    break;
  case IncidentService::Outcome::BLOCKED:
    send_json(res, 403,
              {{"status", "rejected"},
               {"message", "Access denied due to high-risk activity."},
               {"incident_details",
                JsonFormatter::incident_to_json_object(*result.report)}});
    break;
  case IncidentService::Outcome::ALREADY_BLOCKED:
    send_json(res, 429,
              {{"status", "rejected"},
               {"message",
                "Too many requests from this IP. Temporarily blocked."}});
    break;
  }
}

void WebServer::handle_events(const httplib::Request &req,
                              httplib::Response &res) {
  auto channel =
      std::make_shared<SseChannel>(req.remote_addr, config_.observer_queue_limit);
  {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    open_streams_.insert(channel);
  }
  state_.broadcaster.connect(channel);

  const auto keepalive =
      std::chrono::milliseconds(config_.observer_keepalive_seconds * 1000);

  res.set_header("Cache-Control", "no-cache");
  res.set_chunked_content_provider(
      "text/event-stream",
      [channel, keepalive](size_t, httplib::DataSink &sink) {
        if (channel->is_closed())
          return false;

        auto message = channel->next_message(keepalive);
        if (!message && channel->is_closed())
          return false;

        std::string frame = message ? SseChannel::format_frame(*message)
                                    : SseChannel::KEEPALIVE_FRAME;
        return sink.write(frame.data(), frame.size());
      },
      [this, channel](bool) {
        channel->close();
        state_.broadcaster.disconnect(channel);
        std::lock_guard<std::mutex> lock(streams_mutex_);
        open_streams_.erase(channel);
      });
}

void WebServer::handle_add_monitor(const httplib::Request &req,
                                   httplib::Response &res) {
  MonitorConfig config;
  try {
    config = JsonFormatter::monitor_config_from_json(
        nlohmann::json::parse(req.body),
        state_.config->monitoring.default_check_interval_seconds);
  } catch (const nlohmann::json::parse_error &e) {
    send_error(res, 400, std::string("Malformed JSON body: ") + e.what());
    return;
  } catch (const std::invalid_argument &e) {
    send_error(res, 400, e.what());
    return;
  }

  const std::string requested_url = config.url;
  try {
    auto result = monitors_.start(config);
    const std::string target = MonitorRegistry::normalize_url(requested_url);
    if (result == MonitorRegistry::StartResult::ALREADY_MONITORING) {
      send_json(res, 200, {{"status", "already_monitoring"}, {"url", target}});
      return;
    }
    send_json(res, 200, {{"status", "monitoring_started"}, {"url", target}});
  } catch (const std::invalid_argument &) {
    LOG(LogLevel::WARN, LogComponent::IO_WEB, "Invalid URL: " << requested_url);
    send_error(res, 400, "Invalid URL format: '" + requested_url + "'.");
  }
}

void WebServer::handle_remove_monitor(const httplib::Request &req,
                                      httplib::Response &res) {
  const std::string decoded = Utils::url_decode(req.matches[1].str());

  std::string target;
  try {
    target = MonitorRegistry::normalize_url(decoded);
  } catch (const std::invalid_argument &) {
    send_error(res, 400, "Invalid URL encoding.");
    return;
  }

  if (monitors_.stop(target) == MonitorRegistry::StopResult::NOT_FOUND) {
    LOG(LogLevel::WARN, LogComponent::IO_WEB,
        "Attempt to remove non-monitored website: " << decoded);
    send_error(res, 404, "Website not found.");
    return;
  }
  send_json(res, 200, {{"status", "monitoring_stopped"}, {"url", target}});
}

void WebServer::handle_list_monitors(httplib::Response &res) {
  nlohmann::json websites = nlohmann::json::array();
  for (const auto &status : monitors_.list()) {
    nlohmann::json entry;
    entry["url"] = status.config.url;
    entry["config"] = JsonFormatter::monitor_config_to_json_object(status.config);
    entry["current_health"] =
        status.latest
            ? JsonFormatter::health_record_to_json_object(*status.latest)
            : nlohmann::json(nullptr);
    websites.push_back(std::move(entry));
  }
  send_json(res, 200, {{"websites", websites}});
}

void WebServer::handle_attack_log(httplib::Response &res) {
  if (!attack_log_) {
    send_json(res, 200, nlohmann::json::array());
    return;
  }

  try {
    send_json(res, 200, attack_log_->read_all());
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_WEB,
        "Error reading attack log " << attack_log_->get_path() << ": "
                                    << e.what());
    send_error(res, 500, "Failed to retrieve attack log.");
  }
}

void WebServer::start() {
  if (server_thread_.joinable())
    return; // Already running

  running_ = true;
  server_thread_ = std::thread(&WebServer::run, this);
}

void WebServer::stop() {
  if (!server_thread_.joinable())
    return;

  LOG(LogLevel::INFO, LogComponent::IO_WEB, "Web server stopping...");

  // Streaming workers only return once their channel is closed
  {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    for (const auto &stream : open_streams_)
      stream->close();
  }

  server_->stop();
  server_thread_.join();
  running_ = false;
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server listening on " << config_.host << ":" << config_.port);
  if (!server_->listen(config_.host.c_str(), config_.port)) {
    LOG(LogLevel::FATAL, LogComponent::IO_WEB,
        "Web server failed to listen on " << config_.host << ":"
                                          << config_.port);
  }
  running_ = false;
}
