#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "config.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// One entry per subsystem; the INI [Logging] keys map onto these.
enum class LogComponent {
  CORE,
  CONFIG,

  PIPELINE,
  DETECTOR,
  RISK,
  BREAKER,

  RATE_LIMIT,
  METRICS,
  BROADCAST,
  MONITOR,
  SIMULATION,

  IO_SINK,
  IO_GEO,
  IO_WEB,
  IO_THREATINTEL
};

inline const char *level_to_string(LogLevel level) {
  static constexpr const char *names[] = {"TRACE", "DEBUG", "INFO",
                                          "WARN",  "ERROR", "FATAL"};
  return names[static_cast<int>(level)];
}

inline const char *component_to_string(LogComponent component) {
  static constexpr const char *names[] = {
      "CORE",
      "CONFIG",
      "DETECTION.PIPELINE",
      "DETECTION.DETECTOR",
      "DETECTION.RISK",
      "DETECTION.BREAKER",
      "RESPONSE.RATELIMIT",
      "RESPONSE.METRICS",
      "RESPONSE.BROADCAST",
      "RESPONSE.MONITOR",
      "RESPONSE.SIMULATION",
      "IO.SINK",
      "IO.GEO",
      "IO.WEB",
      "IO.THREATINTEL"};
  return names[static_cast<int>(component)];
}

// Process-wide log filter. A component without a configured level is silent.
class LogManager {
public:
  static LogManager &instance() {
    static LogManager manager;
    return manager;
  }

  void configure(const Config::LoggingConfig &config) {
    std::lock_guard<std::mutex> lock(levels_mutex_);
    levels_ = config.log_levels;
  }

  bool should_log(LogLevel level, LogComponent component) const {
    std::lock_guard<std::mutex> lock(levels_mutex_);
    auto it = levels_.find(component);
    return it != levels_.end() && level >= it->second;
  }

  // "2024-05-01T12:00:00.123Z [WARN] [IO.WEB] [file.cpp:42] "
  static std::string prefix(LogLevel level, LogComponent component,
                            const char *file, int line) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch())
                            .count() %
                        1000;
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
        << std::setfill('0') << millis << "Z [" << level_to_string(level)
        << "] [" << component_to_string(component) << "] [" << file << ':'
        << line << "] ";
    return out.str();
  }

  // Whole lines only, so concurrent workers never interleave.
  void write_line(const std::string &line) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << line << std::endl;
  }

private:
  LogManager() = default;

  std::map<LogComponent, LogLevel> levels_;
  mutable std::mutex levels_mutex_;
  std::mutex output_mutex_;
};

// The message expression is only evaluated when the level is enabled.
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (LogManager::instance().should_log(level, component)) {                 \
      std::ostringstream log_stream_;                                          \
      log_stream_ << LogManager::prefix(level, component, __FILE__, __LINE__)  \
                  << message;                                                  \
      LogManager::instance().write_line(log_stream_.str());                    \
    }                                                                          \
  } while (0)

#endif // LOGGER_HPP
