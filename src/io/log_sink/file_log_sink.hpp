#ifndef FILE_LOG_SINK_HPP
#define FILE_LOG_SINK_HPP

#include "base_log_sink.hpp"
#include "core/config.hpp"

#include <mutex>
#include <optional>
#include <string>

// Keeps the attack log as one JSON array on disk. Each entry has its personal
// and payment fields masked and carries a SHA-256 "integrity_hash" of the
// masked entry. A file that does not hold a JSON array is reset.
class FileLogSink : public ILogSink {
public:
  explicit FileLogSink(const Config::LogSinkConfig &cfg);

  bool persist(const nlohmann::json &record) override;
  const char *get_name() const override { return "FileLogSink"; }
  std::string get_sink_type() const override { return "file"; }

  // Masked copy of record with its integrity hash attached.
  nlohmann::json prepare_entry(const nlohmann::json &record) const;

  // Current contents. Empty array when the file is missing or empty; throws
  // std::runtime_error when the file exists but is not a JSON array.
  nlohmann::json read_all() const;

  const std::string &get_path() const { return file_path_; }

  static std::string sha256_hex(const std::string &data);

private:
  nlohmann::json load_existing_entries() const;

  const std::string file_path_;
  const std::vector<std::string> pii_fields_;
  const std::vector<std::string> payment_fields_;
  mutable std::mutex file_mutex_;
};

#endif // FILE_LOG_SINK_HPP
