#ifndef INTEL_MANAGER_HPP
#define INTEL_MANAGER_HPP

#include "utils/cancellable_task.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

// Known-bad addresses merged from plain-text feeds (one address per line, '#'
// comments). Refreshes run on a background task, including the first one, so
// startup never waits on the network. Lookups read an immutable snapshot.
class IntelManager {
public:
  using AddressSet = std::unordered_set<std::string>;

  IntelManager(std::vector<std::string> feed_urls,
               uint32_t refresh_interval_seconds);

  IntelManager(const IntelManager &) = delete;
  IntelManager &operator=(const IntelManager &) = delete;

  bool is_blacklisted(const std::string &ip) const;
  size_t blacklist_size() const;

  // Swaps in a new list wholesale.
  void replace_blacklist(AddressSet ips);

  // Keeps valid IPv4/IPv6 literals, ignoring trailing annotations.
  static AddressSet parse_feed(const std::string &body);

private:
  std::shared_ptr<const AddressSet> snapshot() const;
  void refresh_all(const CancellableTask &task);
  static std::optional<std::string> fetch(const std::string &url);

  const std::vector<std::string> feed_urls_;
  const uint32_t refresh_interval_seconds_;

  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const AddressSet> blacklist_;

  // Last member: joined before the rest is torn down.
  CancellableTask refresher_{"threat_intel_refresh"};
};

#endif // INTEL_MANAGER_HPP
