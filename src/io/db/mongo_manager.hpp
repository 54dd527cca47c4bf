#ifndef MONGO_MANAGER_HPP
#define MONGO_MANAGER_HPP

#include "core/config.hpp"

#include <bsoncxx/document/view.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/pool.hpp>

#include <memory>
#include <string>

// Connection to the incident store: the process-wide driver instance, a
// client pool and the configured database and collection names.
class MongoManager {
public:
  explicit MongoManager(const Config::LogSinkConfig &cfg);

  bool is_initialized() const { return pool_ != nullptr; }

  bool ping();

  // Indexes on timestamp_ms and ip for the dashboard queries. Idempotent.
  bool ensure_incident_indexes();

  // Throws std::runtime_error without a pool and mongocxx exceptions on
  // server errors. Returns false when the write was not acknowledged.
  bool insert_incident(bsoncxx::document::view document);

  const std::string &namespace_name() const { return namespace_; }

private:
  static mongocxx::instance &driver_instance();
  mongocxx::pool::entry acquire();

  const std::string database_;
  const std::string collection_;
  const std::string namespace_;
  std::unique_ptr<mongocxx::pool> pool_;
};

#endif // MONGO_MANAGER_HPP
