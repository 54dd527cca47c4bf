#ifndef MONGO_LOG_SINK_HPP
#define MONGO_LOG_SINK_HPP

#include "base_log_sink.hpp"
#include "core/config.hpp"
#include "io/db/mongo_manager.hpp"

#include <memory>
#include <string>

// Inserts each incident as one document. Records are masked the same way as
// the file sink before they leave the process.
class MongoLogSink : public ILogSink {
public:
  MongoLogSink(std::shared_ptr<MongoManager> manager,
               const Config::LogSinkConfig &cfg);

  bool persist(const nlohmann::json &record) override;
  const char *get_name() const override { return "MongoLogSink"; }
  std::string get_sink_type() const override { return "mongodb"; }

private:
  std::shared_ptr<MongoManager> mongo_manager_;
  const std::vector<std::string> pii_fields_;
  const std::vector<std::string> payment_fields_;
};

#endif // MONGO_LOG_SINK_HPP
