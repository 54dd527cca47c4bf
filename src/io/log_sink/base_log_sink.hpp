#ifndef BASE_LOG_SINK_HPP
#define BASE_LOG_SINK_HPP

#include <nlohmann/json.hpp>

#include <string>

// Persistent storage for incident records.
class ILogSink {
public:
  virtual ~ILogSink() = default;
  virtual bool persist(const nlohmann::json &record) = 0;
  virtual const char *get_name() const = 0;
  virtual std::string get_sink_type() const = 0;
};

#endif // BASE_LOG_SINK_HPP
