#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *SERVICE_NAME = "service_name";

// Web Server Settings
constexpr const char *WS_HOST = "host";
constexpr const char *WS_PORT = "port";
constexpr const char *WS_WORKER_THREADS = "worker_threads";
constexpr const char *WS_OBSERVER_QUEUE_LIMIT = "observer_queue_limit";
constexpr const char *WS_OBSERVER_KEEPALIVE_SECONDS =
    "observer_keepalive_seconds";

// Detection Settings
constexpr const char *DT_SIGNATURES_ENABLED = "signatures_enabled";
constexpr const char *DT_SQLI_PATTERNS = "sql_injection_patterns";
constexpr const char *DT_XSS_PATTERNS = "xss_patterns";
constexpr const char *DT_CARD_TESTING_ENABLED = "card_testing_enabled";
constexpr const char *DT_CARD_TESTING_THRESHOLD = "card_testing_threshold";
constexpr const char *DT_CARD_TESTING_WINDOW_SECONDS =
    "card_testing_window_seconds";
constexpr const char *DT_BRUTE_FORCE_ENABLED = "brute_force_enabled";
constexpr const char *DT_BRUTE_FORCE_THRESHOLD = "brute_force_threshold";
constexpr const char *DT_BRUTE_FORCE_WINDOW_SECONDS =
    "brute_force_window_seconds";
constexpr const char *DT_REQUEST_FLOOD_ENABLED = "request_flood_enabled";
constexpr const char *DT_REQUEST_FLOOD_MAX_REQUESTS =
    "request_flood_max_requests";
constexpr const char *DT_REQUEST_FLOOD_WINDOW_SECONDS =
    "request_flood_window_seconds";
constexpr const char *DT_MAX_TRACKED_EVENTS_PER_KEY =
    "max_tracked_events_per_key";
constexpr const char *DT_MAX_TRACKED_KEYS = "max_tracked_keys";

// Remote Model Settings
constexpr const char *RM_ENABLED = "enabled";
constexpr const char *RM_URL = "url";
constexpr const char *RM_TIMEOUT_MS = "timeout_ms";
constexpr const char *RM_MODEL = "model";

// Circuit Breaker Settings
constexpr const char *CB_FAILURE_THRESHOLD = "failure_threshold";
constexpr const char *CB_FAILURE_WINDOW_SECONDS = "failure_window_seconds";
constexpr const char *CB_COOLDOWN_SECONDS = "cooldown_seconds";

// Risk Scoring Settings
constexpr const char *RS_WEIGHT_LOW = "weight_low";
constexpr const char *RS_WEIGHT_MEDIUM = "weight_medium";
constexpr const char *RS_WEIGHT_HIGH = "weight_high";
constexpr const char *RS_WEIGHT_CRITICAL = "weight_critical";
constexpr const char *RS_MULTI_DETECTION_BONUS = "multi_detection_bonus";
constexpr const char *RS_CRITICAL_UPGRADE_THRESHOLD =
    "critical_upgrade_threshold";

// Rate Limit Settings
constexpr const char *RL_BLOCK_DURATION_SECONDS = "block_duration_seconds";
constexpr const char *RL_SCORE_THRESHOLD = "score_threshold";

// Metrics Settings
constexpr const char *MT_BROADCAST_INTERVAL_SECONDS =
    "broadcast_interval_seconds";
constexpr const char *MT_WINDOW_SECONDS = "window_seconds";
constexpr const char *MT_MAX_SAMPLES = "max_samples";

// Monitoring Settings
constexpr const char *MO_MIN_CHECK_INTERVAL_SECONDS =
    "min_check_interval_seconds";
constexpr const char *MO_DEFAULT_CHECK_INTERVAL_SECONDS =
    "default_check_interval_seconds";
constexpr const char *MO_HEALTH_HISTORY_SIZE = "health_history_size";
constexpr const char *MO_REQUEST_TIMEOUT_SECONDS = "request_timeout_seconds";
constexpr const char *MO_SLOW_RESPONSE_MS = "slow_response_ms";

// Log Sink Settings
constexpr const char *LS_FILE_ENABLED = "file_enabled";
constexpr const char *LS_FILE_PATH = "file_path";
constexpr const char *LS_MONGO_ENABLED = "mongo_enabled";
constexpr const char *LS_MONGO_URI = "mongo_uri";
constexpr const char *LS_MONGO_DATABASE = "mongo_database";
constexpr const char *LS_MONGO_COLLECTION = "mongo_collection";
constexpr const char *LS_PII_FIELDS = "pii_fields";
constexpr const char *LS_PAYMENT_FIELDS = "payment_fields";
constexpr const char *LS_QUEUE_LIMIT = "queue_limit";

// Geolocation Settings
constexpr const char *GEO_ENABLED = "enabled";
constexpr const char *GEO_SERVICE_URL = "service_url";
constexpr const char *GEO_TIMEOUT_SECONDS = "timeout_seconds";
constexpr const char *GEO_QUEUE_LIMIT = "queue_limit";

// Threat Intel Settings
constexpr const char *TI_ENABLED = "enabled";
constexpr const char *TI_FEED_URLS = "feed_urls";
constexpr const char *TI_UPDATE_INTERVAL_SECONDS = "update_interval_seconds";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct WebServerConfig {
  std::string host = "0.0.0.0";
  int port = 10000;
  size_t worker_threads = 32;
  size_t observer_queue_limit = 256;
  uint32_t observer_keepalive_seconds = 15;
};

struct DetectionConfig {
  bool signatures_enabled = true;
  std::vector<std::string> sql_injection_patterns = {
      "' or '1'='1", "' or 1=1", "union select", "; drop table",
      "pg_sleep(",   "--",       "' or '",       "xp_cmdshell"};
  std::vector<std::string> xss_patterns = {"<script", "javascript:",
                                           "onerror=", "onload=", "<iframe"};

  bool card_testing_enabled = true;
  size_t card_testing_threshold = 3;
  uint64_t card_testing_window_seconds = 600;

  bool brute_force_enabled = true;
  size_t brute_force_threshold = 5;
  uint64_t brute_force_window_seconds = 300;

  bool request_flood_enabled = true;
  size_t request_flood_max_requests = 100;
  uint64_t request_flood_window_seconds = 60;

  size_t max_tracked_events_per_key = 100;
  // Distinct IPs or accounts each threshold detector remembers.
  size_t max_tracked_keys = 100000;
};

struct RemoteModelConfig {
  bool enabled = false;
  std::string url = "http://localhost:11434/api/generate";
  uint32_t timeout_ms = 5000;
  std::string model = "llama3";
};

struct CircuitBreakerConfig {
  size_t failure_threshold = 5;
  uint32_t failure_window_seconds = 60;
  uint32_t cooldown_seconds = 300;
};

struct RiskScoringConfig {
  double weight_low = 0.25;
  double weight_medium = 0.5;
  double weight_high = 0.75;
  double weight_critical = 1.0;
  double multi_detection_bonus = 0.05;
  double critical_upgrade_threshold = 0.95;
};

struct RateLimitConfig {
  uint64_t block_duration_seconds = 300;
  double score_threshold = 0.8;
};

struct MetricsConfig {
  uint32_t broadcast_interval_seconds = 5;
  uint64_t window_seconds = 3600;
  size_t max_samples = 500;
};

// Lowest cadence a website may be polled at, whatever the INI says.
constexpr uint32_t MIN_MONITOR_INTERVAL_SECONDS = 30;

struct MonitoringConfig {
  uint32_t min_check_interval_seconds = MIN_MONITOR_INTERVAL_SECONDS;
  uint32_t default_check_interval_seconds = 300;
  size_t health_history_size = 100;
  uint32_t request_timeout_seconds = 10;
  uint32_t slow_response_ms = 3000;
};

struct LogSinkConfig {
  bool file_enabled = true;
  std::string file_path = "attack_log.json";
  bool mongo_enabled = false;
  std::string mongo_uri = "mongodb://localhost:27017";
  std::string mongo_database = "threat_guard";
  std::string mongo_collection = "incidents";
  std::vector<std::string> pii_fields = {"password", "email", "phone",
                                         "ssn",      "address", "cvv"};
  std::vector<std::string> payment_fields = {"payment_token", "card_bin",
                                             "expiry_date", "account_number"};
  // Records waiting for the writer thread; beyond this they are dropped.
  size_t queue_limit = 1000;
};

struct GeolocationConfig {
  bool enabled = false;
  std::string service_url = "http://ip-api.com/json/";
  uint32_t timeout_seconds = 5;
  size_t queue_limit = 1000;
};

struct ThreatIntelConfig {
  bool enabled = false;
  std::vector<std::string> feed_urls;
  uint32_t update_interval_seconds = 3600; // Default: 1 hour
};

struct AppConfig {
  std::string service_name = "threat_guard";

  WebServerConfig web_server;
  DetectionConfig detection;
  RemoteModelConfig remote_model;
  CircuitBreakerConfig circuit_breaker;
  RiskScoringConfig risk_scoring;
  RateLimitConfig rate_limit;
  MetricsConfig metrics;
  MonitoringConfig monitoring;
  LogSinkConfig log_sink;
  GeolocationConfig geolocation;
  ThreatIntelConfig threat_intel;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Validation functions for configuration parameters
bool validate_circuit_breaker_config(const CircuitBreakerConfig &config,
                                     std::vector<std::string> &errors);
bool validate_risk_scoring_config(const RiskScoringConfig &config,
                                  std::vector<std::string> &errors);
bool validate_metrics_config(const MetricsConfig &config,
                             std::vector<std::string> &errors);
bool validate_monitoring_config(const MonitoringConfig &config,
                                std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Fills the logging defaults used when no [Logging] section overrides them.
void apply_default_log_levels(LoggingConfig &logging);

class ConfigManager {
public:
  // Starts from the built-in defaults, log levels included.
  ConfigManager();
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_;
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
