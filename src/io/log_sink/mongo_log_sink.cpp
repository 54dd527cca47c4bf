#include "mongo_log_sink.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"

#include <bsoncxx/json.hpp>

MongoLogSink::MongoLogSink(std::shared_ptr<MongoManager> manager,
                           const Config::LogSinkConfig &cfg)
    : mongo_manager_(std::move(manager)), pii_fields_(cfg.pii_fields),
      payment_fields_(cfg.payment_fields) {}

bool MongoLogSink::persist(const nlohmann::json &record) {
  if (!mongo_manager_ || !mongo_manager_->is_initialized())
    return false;

  nlohmann::json masked = record;
  if (masked.is_object() && masked.contains("data"))
    masked["data"] = JsonFormatter::mask_sensitive_fields(
        masked["data"], pii_fields_, payment_fields_);
  masked =
      JsonFormatter::mask_sensitive_fields(masked, pii_fields_, payment_fields_);

  try {
    auto document = bsoncxx::from_json(masked.dump());
    if (!mongo_manager_->insert_incident(document.view())) {
      LOG(LogLevel::WARN, LogComponent::IO_SINK,
          "MongoDB insert into " << mongo_manager_->namespace_name()
                                 << " was not acknowledged.");
      return false;
    }
    return true;
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_SINK,
        "MongoDB insert failed: " << e.what());
    return false;
  }
}
