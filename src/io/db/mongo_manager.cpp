#include "mongo_manager.hpp"
#include "core/logger.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/uri.hpp>

#include <stdexcept>

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

mongocxx::instance &MongoManager::driver_instance() {
  static mongocxx::instance instance{};
  return instance;
}

MongoManager::MongoManager(const Config::LogSinkConfig &cfg)
    : database_(cfg.mongo_database), collection_(cfg.mongo_collection),
      namespace_(cfg.mongo_database + "." + cfg.mongo_collection) {
  driver_instance();
  try {
    pool_ = std::make_unique<mongocxx::pool>(mongocxx::uri{cfg.mongo_uri});
    LOG(LogLevel::INFO, LogComponent::IO_SINK,
        "Incident store pool ready for " << namespace_);
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_SINK,
        "Could not create MongoDB pool for " << cfg.mongo_uri << ": "
                                             << e.what());
    pool_ = nullptr;
  }
}

mongocxx::pool::entry MongoManager::acquire() {
  if (!pool_)
    throw std::runtime_error("MongoDB pool is not initialized.");
  return pool_->acquire();
}

bool MongoManager::ping() {
  try {
    auto client = acquire();
    (*client)["admin"].run_command(make_document(kvp("ping", 1)));
    return true;
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::IO_SINK,
        "MongoDB server is unreachable: " << e.what());
    return false;
  }
}

bool MongoManager::ensure_incident_indexes() {
  try {
    auto client = acquire();
    auto incidents = (*client)[database_][collection_];
    incidents.create_index(make_document(kvp("timestamp_ms", -1)));
    incidents.create_index(make_document(kvp("ip", 1), kvp("timestamp_ms", -1)));
    LOG(LogLevel::DEBUG, LogComponent::IO_SINK,
        "Indexes ensured on " << namespace_);
    return true;
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::IO_SINK,
        "Could not create indexes on " << namespace_ << ": " << e.what());
    return false;
  }
}

bool MongoManager::insert_incident(bsoncxx::document::view document) {
  auto client = acquire();
  auto result = (*client)[database_][collection_].insert_one(document);
  return static_cast<bool>(result);
}
