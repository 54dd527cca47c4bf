#include "intel_manager.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <httplib.h>

#include <arpa/inet.h>
#include <chrono>
#include <sstream>

namespace {

constexpr time_t FEED_CONNECT_TIMEOUT_S = 10;
constexpr time_t FEED_READ_TIMEOUT_S = 30;

bool is_ip_literal(const std::string &text) {
  unsigned char buffer[sizeof(struct in6_addr)];
  return inet_pton(AF_INET, text.c_str(), buffer) == 1 ||
         inet_pton(AF_INET6, text.c_str(), buffer) == 1;
}

// Body of a 200 answer, nullopt otherwise.
template <typename Client>
std::optional<std::string> get_body(Client &client, const std::string &path,
                                    const std::string &url) {
  client.set_connection_timeout(FEED_CONNECT_TIMEOUT_S);
  client.set_read_timeout(FEED_READ_TIMEOUT_S);
  auto response = client.Get(path.c_str());
  if (!response) {
    LOG(LogLevel::ERROR, LogComponent::IO_THREATINTEL,
        "Feed " << url << " unreachable: "
                << httplib::to_string(response.error()));
    return std::nullopt;
  }
  if (response->status != 200) {
    LOG(LogLevel::ERROR, LogComponent::IO_THREATINTEL,
        "Feed " << url << " answered HTTP " << response->status);
    return std::nullopt;
  }
  return response->body;
}

} // namespace

IntelManager::IntelManager(std::vector<std::string> feed_urls,
                           uint32_t refresh_interval_seconds)
    : feed_urls_(std::move(feed_urls)),
      refresh_interval_seconds_(refresh_interval_seconds),
      blacklist_(std::make_shared<const AddressSet>()) {
  if (feed_urls_.empty()) {
    LOG(LogLevel::INFO, LogComponent::IO_THREATINTEL,
        "No threat feeds configured; blacklist stays empty.");
    return;
  }

  LOG(LogLevel::INFO, LogComponent::IO_THREATINTEL,
      "Refreshing " << feed_urls_.size() << " threat feed(s) every "
                    << refresh_interval_seconds_ << "s.");
  refresher_.start([this](CancellableTask &task) {
    do {
      refresh_all(task);
    } while (task.wait_for(std::chrono::seconds(refresh_interval_seconds_)));
  });
}

std::shared_ptr<const IntelManager::AddressSet> IntelManager::snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return blacklist_;
}

bool IntelManager::is_blacklisted(const std::string &ip) const {
  return snapshot()->count(ip) > 0;
}

size_t IntelManager::blacklist_size() const { return snapshot()->size(); }

void IntelManager::replace_blacklist(AddressSet ips) {
  auto fresh = std::make_shared<const AddressSet>(std::move(ips));
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  blacklist_ = std::move(fresh);
}

IntelManager::AddressSet IntelManager::parse_feed(const std::string &body) {
  AddressSet ips;
  std::istringstream lines(body);
  std::string raw;
  while (std::getline(lines, raw)) {
    const std::string line = Utils::trim_copy(raw);
    if (line.empty() || line.front() == '#')
      continue;

    // "1.2.3.4 # note" and "1.2.3.4;score" both occur in the wild.
    std::string address = line.substr(0, line.find_first_of(" \t;#"));
    if (is_ip_literal(address))
      ips.insert(std::move(address));
  }
  return ips;
}

std::optional<std::string> IntelManager::fetch(const std::string &url) {
  auto target = Utils::parse_url(url);
  if (!target) {
    LOG(LogLevel::WARN, LogComponent::IO_THREATINTEL,
        "Skipping malformed feed URL: " << url);
    return std::nullopt;
  }

  if (target->scheme == "https") {
    httplib::SSLClient client(target->host,
                              target->port > 0 ? target->port : 443);
    client.enable_server_certificate_verification(false);
    return get_body(client, target->path, url);
  }
  httplib::Client client(target->host, target->port > 0 ? target->port : 80);
  return get_body(client, target->path, url);
}

void IntelManager::refresh_all(const CancellableTask &task) {
  AddressSet merged;
  size_t feeds_ok = 0;

  for (const auto &url : feed_urls_) {
    if (task.is_cancelled())
      return;
    auto body = fetch(url);
    if (!body)
      continue;
    auto ips = parse_feed(*body);
    LOG(LogLevel::DEBUG, LogComponent::IO_THREATINTEL,
        url << " listed " << ips.size() << " address(es).");
    merged.insert(ips.begin(), ips.end());
    ++feeds_ok;
  }

  // A refresh where every feed failed keeps the previous list.
  if (feeds_ok == 0) {
    LOG(LogLevel::WARN, LogComponent::IO_THREATINTEL,
        "No threat feed reachable; keeping " << blacklist_size()
                                             << " known address(es).");
    return;
  }

  const size_t total = merged.size();
  replace_blacklist(std::move(merged));
  LOG(LogLevel::INFO, LogComponent::IO_THREATINTEL,
      "Blacklist refreshed from " << feeds_ok << "/" << feed_urls_.size()
                                  << " feed(s): " << total << " address(es).");
}
