#ifndef UTILS_HPP
#define UTILS_HPP

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
std::vector<std::string> split_string(const std::string &text, char delimiter);
uint64_t get_current_time_ms();
std::string format_iso8601_ms(uint64_t timestamp_ms);
std::optional<uint64_t> parse_iso8601_ms(std::string_view iso_string);
std::string url_decode(std::string_view encoded_string);
std::string to_lower_copy(std::string_view input);
bool is_loopback_address(std::string_view ip);

struct ParsedUrl {
  std::string scheme;
  std::string host; // without port
  int port = 0;     // 0 when not given explicitly
  std::string path = "/";
};

std::optional<ParsedUrl> parse_url(std::string_view url);

// Whole-string numeric parse. Blank or "-" reads as zero, matching how unset
// INI values are written.
template <typename T> std::optional<T> string_to_number(std::string_view text) {
  static_assert(std::is_arithmetic_v<T>, "numeric target required");
  if (text.empty() || text == "-")
    return T{};

  T parsed{};
  const char *last = text.data() + text.size();
  auto result = std::from_chars(text.data(), last, parsed);
  if (result.ec != std::errc() || result.ptr != last)
    return std::nullopt;
  return parsed;
}

std::string trim_copy(std::string_view text);
} // namespace Utils

#endif // UTILS_HPP
