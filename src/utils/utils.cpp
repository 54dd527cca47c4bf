#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {
std::string url_decode(std::string_view encoded_string) {
  std::ostringstream decoded_stream;

  for (size_t i = 0; i < encoded_string.length(); i++) {
    if (encoded_string[i] == '%' && i + 2 < encoded_string.length() &&
        std::isxdigit(static_cast<unsigned char>(encoded_string[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(encoded_string[i + 2]))) {
      std::string hex{encoded_string.substr(i + 1, 2)};
      decoded_stream << static_cast<char>(std::stoi(hex, nullptr, 16));
      i += 2;
    } else if (encoded_string[i] == '+')
      decoded_stream << ' ';
    else
      decoded_stream << encoded_string[i];
  }
  return decoded_stream.str();
}

std::vector<std::string> split_string(const std::string &text,
                                      char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    std::string trimmed = trim_copy(current_token);
    if (!trimmed.empty())
      tokens.push_back(std::move(trimmed));
  }
  return tokens;
}

uint64_t get_current_time_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string format_iso8601_ms(uint64_t timestamp_ms) {
  auto seconds = static_cast<std::time_t>(timestamp_ms / 1000);
  std::tm tm_buf{};
  gmtime_r(&seconds, &tm_buf);

  char buffer[40];
  std::size_t written =
      std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm_buf);
  if (written == 0)
    return std::to_string(timestamp_ms);

  char millis[8];
  std::snprintf(millis, sizeof(millis), ".%03u",
                static_cast<unsigned>(timestamp_ms % 1000));
  return std::string(buffer, written) + millis + "Z";
}

std::optional<uint64_t> parse_iso8601_ms(std::string_view iso_string) {
  // Expected format: 2025-05-23T00:00:35.123Z (fraction optional)
  if (iso_string.size() < 19)
    return std::nullopt;

  std::tm t{};
  std::string head{iso_string.substr(0, 19)};
  if (std::sscanf(head.c_str(), "%d-%d-%dT%d:%d:%d", &t.tm_year, &t.tm_mon,
                  &t.tm_mday, &t.tm_hour, &t.tm_min, &t.tm_sec) != 6)
    return std::nullopt;
  t.tm_year -= 1900;
  t.tm_mon -= 1;

  std::time_t seconds = timegm(&t);
  if (seconds == static_cast<std::time_t>(-1))
    return std::nullopt;

  uint64_t millis = 0;
  if (iso_string.size() > 20 && iso_string[19] == '.') {
    std::string_view fraction = iso_string.substr(20, 3);
    auto parsed = string_to_number<uint64_t>(fraction);
    if (parsed && fraction.size() == 3)
      millis = *parsed;
  }
  return static_cast<uint64_t>(seconds) * 1000 + millis;
}

std::string trim_copy(std::string_view text) {
  constexpr std::string_view whitespace = " \t\r\n\f\v";
  const size_t first = text.find_first_not_of(whitespace);
  if (first == std::string_view::npos)
    return {};
  const size_t last = text.find_last_not_of(whitespace);
  return std::string{text.substr(first, last - first + 1)};
}

std::string to_lower_copy(std::string_view input) {
  std::string out{input};
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

bool is_loopback_address(std::string_view ip) {
  return ip.empty() || ip == "localhost" || ip == "::1" || ip == "unknown" ||
         ip.rfind("127.", 0) == 0;
}

std::optional<ParsedUrl> parse_url(std::string_view url) {
  ParsedUrl parsed;

  size_t scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0)
    return std::nullopt;
  parsed.scheme = to_lower_copy(url.substr(0, scheme_end));

  std::string_view rest = url.substr(scheme_end + 3);
  size_t path_start = rest.find_first_of("/?#");
  std::string_view authority = rest.substr(0, path_start);
  if (path_start != std::string_view::npos) {
    std::string_view tail = rest.substr(path_start);
    parsed.path = tail[0] == '/' ? std::string(tail) : "/" + std::string(tail);
  }

  // Strip userinfo
  size_t at = authority.rfind('@');
  if (at != std::string_view::npos)
    authority = authority.substr(at + 1);

  std::string_view host_part = authority;
  if (!authority.empty() && authority.front() == '[') {
    size_t close = authority.find(']');
    if (close == std::string_view::npos)
      return std::nullopt;
    host_part = authority.substr(0, close + 1);
    std::string_view after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':')
        return std::nullopt;
      auto port = string_to_number<int>(after.substr(1));
      if (!port || *port <= 0 || *port > 65535)
        return std::nullopt;
      parsed.port = *port;
    }
  } else {
    size_t colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
      host_part = authority.substr(0, colon);
      auto port = string_to_number<int>(authority.substr(colon + 1));
      if (!port || *port <= 0 || *port > 65535)
        return std::nullopt;
      parsed.port = *port;
    }
  }

  parsed.host = to_lower_copy(host_part);
  if (parsed.host.empty())
    return std::nullopt;
  return parsed;
}
} // namespace Utils
