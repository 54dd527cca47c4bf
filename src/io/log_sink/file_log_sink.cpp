#include "file_log_sink.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"

#include <openssl/evp.h>

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

FileLogSink::FileLogSink(const Config::LogSinkConfig &cfg)
    : file_path_(cfg.file_path), pii_fields_(cfg.pii_fields),
      payment_fields_(cfg.payment_fields) {
  std::filesystem::path parent = std::filesystem::path(file_path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
      LOG(LogLevel::ERROR, LogComponent::IO_SINK,
          "FileLogSink could not create directory " << parent << ": "
                                                    << ec.message());
  }
}

std::string FileLogSink::sha256_hex(const std::string &data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_length = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &digest_length,
                 EVP_sha256(), nullptr) != 1)
    throw std::runtime_error("SHA-256 digest failed");

  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < digest_length; ++i)
    hex << std::setw(2) << static_cast<int>(digest[i]);
  return hex.str();
}

nlohmann::json FileLogSink::prepare_entry(const nlohmann::json &record) const {
  nlohmann::json entry = record;
  if (entry.is_object()) {
    auto data_it = entry.find("data");
    if (data_it != entry.end() && data_it->is_object())
      *data_it = JsonFormatter::mask_sensitive_fields(*data_it, pii_fields_,
                                                      payment_fields_);
  }
  entry = JsonFormatter::mask_sensitive_fields(entry, pii_fields_,
                                               payment_fields_);

  // Object keys serialize in sorted order, so the hash is stable
  try {
    entry["integrity_hash"] = sha256_hex(entry.dump());
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_SINK,
        "Failed to create integrity hash for log entry: " << e.what());
    entry["integrity_hash"] = "hash_error";
  }
  return entry;
}

nlohmann::json FileLogSink::load_existing_entries() const {
  std::ifstream in(file_path_);
  if (!in.is_open())
    return nlohmann::json::array();

  std::stringstream buffer;
  buffer << in.rdbuf();
  const std::string content = buffer.str();
  if (content.empty())
    return nlohmann::json::array();

  try {
    auto parsed = nlohmann::json::parse(content);
    if (parsed.is_array())
      return parsed;
    LOG(LogLevel::WARN, LogComponent::IO_SINK,
        "Log file " << file_path_ << " was not a list, resetting.");
  } catch (const nlohmann::json::parse_error &e) {
    LOG(LogLevel::WARN, LogComponent::IO_SINK,
        "Log file " << file_path_ << " corrupted, resetting: " << e.what());
  }
  return nlohmann::json::array();
}

bool FileLogSink::persist(const nlohmann::json &record) {
  nlohmann::json entry = prepare_entry(record);

  std::lock_guard<std::mutex> lock(file_mutex_);
  nlohmann::json attack_log = load_existing_entries();
  attack_log.push_back(std::move(entry));

  std::ofstream out(file_path_, std::ios::trunc);
  if (!out.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_SINK,
        "Failed to open attack log " << file_path_ << " for writing.");
    return false;
  }

  try {
    out << attack_log.dump(2);
  } catch (const nlohmann::json::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_SINK,
        "Failed to serialize attack log " << file_path_ << ": " << e.what());
    return false;
  }
  out.flush();

  if (!out.good()) {
    LOG(LogLevel::ERROR, LogComponent::IO_SINK,
        "Failed to write to attack log " << file_path_);
    return false;
  }
  LOG(LogLevel::TRACE, LogComponent::IO_SINK,
      "Incident appended to " << file_path_ << " (" << attack_log.size()
                              << " entries)");
  return true;
}

nlohmann::json FileLogSink::read_all() const {
  std::lock_guard<std::mutex> lock(file_mutex_);
  std::ifstream in(file_path_);
  if (!in.is_open())
    return nlohmann::json::array();

  std::stringstream buffer;
  buffer << in.rdbuf();
  if (buffer.str().empty())
    return nlohmann::json::array();

  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(buffer.str());
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error("Attack log is not valid JSON: " +
                             std::string(e.what()));
  }
  if (!parsed.is_array())
    throw std::runtime_error("Invalid log file format.");
  return parsed;
}
