#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"detection.pipeline", LogComponent::PIPELINE},
    {"detection.detector", LogComponent::DETECTOR},
    {"detection.risk", LogComponent::RISK},
    {"detection.breaker", LogComponent::BREAKER},
    {"response.ratelimit", LogComponent::RATE_LIMIT},
    {"response.metrics", LogComponent::METRICS},
    {"response.broadcast", LogComponent::BROADCAST},
    {"response.monitor", LogComponent::MONITOR},
    {"response.simulation", LogComponent::SIMULATION},
    {"io.sink", LogComponent::IO_SINK},
    {"io.geo", LogComponent::IO_GEO},
    {"io.web", LogComponent::IO_WEB},
    {"io.threatintel", LogComponent::IO_THREATINTEL}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

void apply_default_log_levels(LoggingConfig &logging) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
  // Except for CORE, which we want to see INFO messages from by default
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

bool validate_circuit_breaker_config(const CircuitBreakerConfig &config,
                                     std::vector<std::string> &errors) {
  bool valid = true;

  if (config.failure_threshold < 1 || config.failure_threshold > 1000) {
    errors.push_back("Circuit breaker failure threshold must be between 1 and "
                     "1000");
    valid = false;
  }

  if (config.failure_window_seconds < 1) {
    errors.push_back("Circuit breaker failure window must be at least 1 "
                     "second");
    valid = false;
  }

  if (config.cooldown_seconds < 1 || config.cooldown_seconds > 86400) {
    errors.push_back("Circuit breaker cooldown must be between 1 and 86400 "
                     "seconds");
    valid = false;
  }

  return valid;
}

bool validate_risk_scoring_config(const RiskScoringConfig &config,
                                  std::vector<std::string> &errors) {
  bool valid = true;

  if (!(0.0 < config.weight_low && config.weight_low < config.weight_medium &&
        config.weight_medium < config.weight_high &&
        config.weight_high < config.weight_critical &&
        config.weight_critical <= 1.0)) {
    errors.push_back("Risk scoring weights must satisfy 0 < low < medium < "
                     "high < critical <= 1");
    valid = false;
  }

  if (config.multi_detection_bonus < 0.0 ||
      config.multi_detection_bonus > 0.5) {
    errors.push_back(
        "Risk scoring multi detection bonus must be between 0.0 and 0.5");
    valid = false;
  }

  if (config.critical_upgrade_threshold <= 0.0 ||
      config.critical_upgrade_threshold > 1.0) {
    errors.push_back("Risk scoring critical upgrade threshold must be in "
                     "(0.0, 1.0]");
    valid = false;
  }

  return valid;
}

bool validate_metrics_config(const MetricsConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.broadcast_interval_seconds < 1 ||
      config.broadcast_interval_seconds > 3600) {
    errors.push_back(
        "Metrics broadcast interval must be between 1 and 3600 seconds");
    valid = false;
  }

  if (config.window_seconds < 1) {
    errors.push_back("Metrics window must be at least 1 second");
    valid = false;
  }

  if (config.max_samples < 1) {
    errors.push_back("Metrics max samples must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_monitoring_config(const MonitoringConfig &config,
                                std::vector<std::string> &errors) {
  bool valid = true;

  if (config.min_check_interval_seconds < MIN_MONITOR_INTERVAL_SECONDS) {
    errors.push_back("Monitoring min check interval must be at least " +
                     std::to_string(MIN_MONITOR_INTERVAL_SECONDS) + " seconds");
    valid = false;
  }

  if (config.default_check_interval_seconds <
      config.min_check_interval_seconds) {
    errors.push_back("Monitoring default check interval must not be below the "
                     "minimum check interval");
    valid = false;
  }

  if (config.health_history_size < 1) {
    errors.push_back("Monitoring health history size must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.web_server.port < 1 || config.web_server.port > 65535) {
    errors.push_back("Web server port must be between 1 and 65535");
    valid = false;
  }

  if (config.web_server.worker_threads < 2) {
    errors.push_back("Web server needs at least 2 worker threads");
    valid = false;
  }

  if (!validate_circuit_breaker_config(config.circuit_breaker, errors))
    valid = false;

  if (!validate_risk_scoring_config(config.risk_scoring, errors))
    valid = false;

  if (!validate_metrics_config(config.metrics, errors))
    valid = false;

  if (!validate_monitoring_config(config.monitoring, errors))
    valid = false;

  if (config.rate_limit.score_threshold <= 0.0 ||
      config.rate_limit.score_threshold > 1.0) {
    errors.push_back("Rate limit score threshold must be in (0.0, 1.0]");
    valid = false;
  }

  if (config.rate_limit.block_duration_seconds < 1) {
    errors.push_back("Rate limit block duration must be at least 1 second");
    valid = false;
  }

  if (config.detection.card_testing_threshold < 1 ||
      config.detection.brute_force_threshold < 1 ||
      config.detection.request_flood_max_requests < 1) {
    errors.push_back("Detection thresholds must be at least 1");
    valid = false;
  }

  if (config.detection.max_tracked_keys < 1) {
    errors.push_back("Detection must track at least 1 key");
    valid = false;
  }

  if (config.log_sink.queue_limit < 1 || config.geolocation.queue_limit < 1) {
    errors.push_back("Log sink and geolocation queue limits must be at least 1");
    valid = false;
  }

  // Cross-component validation
  if (config.remote_model.enabled &&
      !Utils::parse_url(config.remote_model.url)) {
    errors.push_back("Remote model is enabled but its url is not valid");
    valid = false;
  }

  if (config.log_sink.file_enabled && config.log_sink.file_path.empty()) {
    errors.push_back("File log sink is enabled but no file_path is set");
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  apply_default_log_levels(config.logging);

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    // Global (non-section) keys
    if (current_section.empty()) {
      if (key == Keys::SERVICE_NAME)
        config.service_name = value;
      else
        config.custom_settings[key] = value;

    } else if (current_section == "WebServer") {
      if (key == Keys::WS_HOST)
        config.web_server.host = value;
      else if (key == Keys::WS_PORT)
        config.web_server.port = Utils::string_to_number<int>(value).value_or(
            config.web_server.port);
      else if (key == Keys::WS_WORKER_THREADS)
        config.web_server.worker_threads =
            Utils::string_to_number<size_t>(value).value_or(
                config.web_server.worker_threads);
      else if (key == Keys::WS_OBSERVER_QUEUE_LIMIT)
        config.web_server.observer_queue_limit =
            Utils::string_to_number<size_t>(value).value_or(
                config.web_server.observer_queue_limit);
      else if (key == Keys::WS_OBSERVER_KEEPALIVE_SECONDS)
        config.web_server.observer_keepalive_seconds =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.web_server.observer_keepalive_seconds);

    } else if (current_section == "Detection") {
      auto &det = config.detection;
      if (key == Keys::DT_SIGNATURES_ENABLED)
        det.signatures_enabled = string_to_bool(value);
      else if (key == Keys::DT_SQLI_PATTERNS) {
        std::vector<std::string> patterns = Utils::split_string(value, ',');
        if (!patterns.empty())
          det.sql_injection_patterns = patterns;
      } else if (key == Keys::DT_XSS_PATTERNS) {
        std::vector<std::string> patterns = Utils::split_string(value, ',');
        if (!patterns.empty())
          det.xss_patterns = patterns;
      } else if (key == Keys::DT_CARD_TESTING_ENABLED)
        det.card_testing_enabled = string_to_bool(value);
      else if (key == Keys::DT_CARD_TESTING_THRESHOLD)
        det.card_testing_threshold =
            Utils::string_to_number<size_t>(value).value_or(
                det.card_testing_threshold);
      else if (key == Keys::DT_CARD_TESTING_WINDOW_SECONDS)
        det.card_testing_window_seconds =
            Utils::string_to_number<uint64_t>(value).value_or(
                det.card_testing_window_seconds);
      else if (key == Keys::DT_BRUTE_FORCE_ENABLED)
        det.brute_force_enabled = string_to_bool(value);
      else if (key == Keys::DT_BRUTE_FORCE_THRESHOLD)
        det.brute_force_threshold =
            Utils::string_to_number<size_t>(value).value_or(
                det.brute_force_threshold);
      else if (key == Keys::DT_BRUTE_FORCE_WINDOW_SECONDS)
        det.brute_force_window_seconds =
            Utils::string_to_number<uint64_t>(value).value_or(
                det.brute_force_window_seconds);
      else if (key == Keys::DT_REQUEST_FLOOD_ENABLED)
        det.request_flood_enabled = string_to_bool(value);
      else if (key == Keys::DT_REQUEST_FLOOD_MAX_REQUESTS)
        det.request_flood_max_requests =
            Utils::string_to_number<size_t>(value).value_or(
                det.request_flood_max_requests);
      else if (key == Keys::DT_REQUEST_FLOOD_WINDOW_SECONDS)
        det.request_flood_window_seconds =
            Utils::string_to_number<uint64_t>(value).value_or(
                det.request_flood_window_seconds);
      else if (key == Keys::DT_MAX_TRACKED_EVENTS_PER_KEY)
        det.max_tracked_events_per_key =
            Utils::string_to_number<size_t>(value).value_or(
                det.max_tracked_events_per_key);
      else if (key == Keys::DT_MAX_TRACKED_KEYS)
        det.max_tracked_keys = Utils::string_to_number<size_t>(value).value_or(
            det.max_tracked_keys);

    } else if (current_section == "RemoteModel") {
      if (key == Keys::RM_ENABLED)
        config.remote_model.enabled = string_to_bool(value);
      else if (key == Keys::RM_URL)
        config.remote_model.url = value;
      else if (key == Keys::RM_TIMEOUT_MS)
        config.remote_model.timeout_ms =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.remote_model.timeout_ms);
      else if (key == Keys::RM_MODEL)
        config.remote_model.model = value;

    } else if (current_section == "CircuitBreaker") {
      auto &cb = config.circuit_breaker;
      if (key == Keys::CB_FAILURE_THRESHOLD)
        cb.failure_threshold =
            Utils::string_to_number<size_t>(value).value_or(
                cb.failure_threshold);
      else if (key == Keys::CB_FAILURE_WINDOW_SECONDS)
        cb.failure_window_seconds =
            Utils::string_to_number<uint32_t>(value).value_or(
                cb.failure_window_seconds);
      else if (key == Keys::CB_COOLDOWN_SECONDS)
        cb.cooldown_seconds = Utils::string_to_number<uint32_t>(value).value_or(
            cb.cooldown_seconds);

    } else if (current_section == "RiskScoring") {
      auto &rs = config.risk_scoring;
      if (key == Keys::RS_WEIGHT_LOW)
        rs.weight_low =
            Utils::string_to_number<double>(value).value_or(rs.weight_low);
      else if (key == Keys::RS_WEIGHT_MEDIUM)
        rs.weight_medium =
            Utils::string_to_number<double>(value).value_or(rs.weight_medium);
      else if (key == Keys::RS_WEIGHT_HIGH)
        rs.weight_high =
            Utils::string_to_number<double>(value).value_or(rs.weight_high);
      else if (key == Keys::RS_WEIGHT_CRITICAL)
        rs.weight_critical = Utils::string_to_number<double>(value).value_or(
            rs.weight_critical);
      else if (key == Keys::RS_MULTI_DETECTION_BONUS)
        rs.multi_detection_bonus =
            Utils::string_to_number<double>(value).value_or(
                rs.multi_detection_bonus);
      else if (key == Keys::RS_CRITICAL_UPGRADE_THRESHOLD)
        rs.critical_upgrade_threshold =
            Utils::string_to_number<double>(value).value_or(
                rs.critical_upgrade_threshold);

    } else if (current_section == "RateLimit") {
      if (key == Keys::RL_BLOCK_DURATION_SECONDS)
        config.rate_limit.block_duration_seconds =
            Utils::string_to_number<uint64_t>(value).value_or(
                config.rate_limit.block_duration_seconds);
      else if (key == Keys::RL_SCORE_THRESHOLD)
        config.rate_limit.score_threshold =
            Utils::string_to_number<double>(value).value_or(
                config.rate_limit.score_threshold);

    } else if (current_section == "Metrics") {
      if (key == Keys::MT_BROADCAST_INTERVAL_SECONDS)
        config.metrics.broadcast_interval_seconds =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.metrics.broadcast_interval_seconds);
      else if (key == Keys::MT_WINDOW_SECONDS)
        config.metrics.window_seconds =
            Utils::string_to_number<uint64_t>(value).value_or(
                config.metrics.window_seconds);
      else if (key == Keys::MT_MAX_SAMPLES)
        config.metrics.max_samples =
            Utils::string_to_number<size_t>(value).value_or(
                config.metrics.max_samples);

    } else if (current_section == "Monitoring") {
      auto &mo = config.monitoring;
      if (key == Keys::MO_MIN_CHECK_INTERVAL_SECONDS)
        mo.min_check_interval_seconds =
            Utils::string_to_number<uint32_t>(value).value_or(
                mo.min_check_interval_seconds);
      else if (key == Keys::MO_DEFAULT_CHECK_INTERVAL_SECONDS)
        mo.default_check_interval_seconds =
            Utils::string_to_number<uint32_t>(value).value_or(
                mo.default_check_interval_seconds);
      else if (key == Keys::MO_HEALTH_HISTORY_SIZE)
        mo.health_history_size =
            Utils::string_to_number<size_t>(value).value_or(
                mo.health_history_size);
      else if (key == Keys::MO_REQUEST_TIMEOUT_SECONDS)
        mo.request_timeout_seconds =
            Utils::string_to_number<uint32_t>(value).value_or(
                mo.request_timeout_seconds);
      else if (key == Keys::MO_SLOW_RESPONSE_MS)
        mo.slow_response_ms = Utils::string_to_number<uint32_t>(value).value_or(
            mo.slow_response_ms);

    } else if (current_section == "LogSink") {
      auto &ls = config.log_sink;
      if (key == Keys::LS_FILE_ENABLED)
        ls.file_enabled = string_to_bool(value);
      else if (key == Keys::LS_FILE_PATH)
        ls.file_path = value;
      else if (key == Keys::LS_MONGO_ENABLED)
        ls.mongo_enabled = string_to_bool(value);
      else if (key == Keys::LS_MONGO_URI)
        ls.mongo_uri = value;
      else if (key == Keys::LS_MONGO_DATABASE)
        ls.mongo_database = value;
      else if (key == Keys::LS_MONGO_COLLECTION)
        ls.mongo_collection = value;
      else if (key == Keys::LS_PII_FIELDS)
        ls.pii_fields = Utils::split_string(value, ',');
      else if (key == Keys::LS_PAYMENT_FIELDS)
        ls.payment_fields = Utils::split_string(value, ',');
      else if (key == Keys::LS_QUEUE_LIMIT)
        ls.queue_limit =
            Utils::string_to_number<size_t>(value).value_or(ls.queue_limit);

    } else if (current_section == "Geolocation") {
      if (key == Keys::GEO_ENABLED)
        config.geolocation.enabled = string_to_bool(value);
      else if (key == Keys::GEO_SERVICE_URL)
        config.geolocation.service_url = value;
      else if (key == Keys::GEO_TIMEOUT_SECONDS)
        config.geolocation.timeout_seconds =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.geolocation.timeout_seconds);
      else if (key == Keys::GEO_QUEUE_LIMIT)
        config.geolocation.queue_limit =
            Utils::string_to_number<size_t>(value).value_or(
                config.geolocation.queue_limit);

    } else if (current_section == "ThreatIntel") {
      if (key == Keys::TI_ENABLED)
        config.threat_intel.enabled = string_to_bool(value);
      else if (key == Keys::TI_FEED_URLS) {
        std::vector<std::string> feed_urls = Utils::split_string(value, ',');
        if (!feed_urls.empty())
          config.threat_intel.feed_urls = feed_urls;
      } else if (key == Keys::TI_UPDATE_INTERVAL_SECONDS)
        config.threat_intel.update_interval_seconds =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.threat_intel.update_interval_seconds);

    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "detection.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map) {
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
          }
        } else {
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown logging component '" << key << "'"
                    << std::endl;
        }
      }
    } else {
      std::cerr << "Warning (Config Line " << line_num
                << "): Key '" << key << "' in unknown section '"
                << current_section << "' ignored." << std::endl;
    }
  }

  config_file.close();
  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

ConfigManager::ConfigManager() {
  auto defaults = std::make_shared<AppConfig>();
  apply_default_log_levels(defaults->logging);
  current_config_ = defaults;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
