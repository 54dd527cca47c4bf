#include "pattern_detector.hpp"
#include "core/logger.hpp"

namespace {

void append_strings(const nlohmann::json &node, std::string &out) {
  if (node.is_string()) {
    out += node.get_ref<const std::string &>();
    out += '\n';
  } else if (node.is_object()) {
    for (const auto &item : node.items()) {
      out += item.key();
      out += '\n';
      append_strings(item.value(), out);
    }
  } else if (node.is_array()) {
    for (const auto &element : node)
      append_strings(element, out);
  }
}

} // namespace

std::string collect_searchable_text(const nlohmann::json &node) {
  std::string text;
  append_strings(node, text);
  return text;
}

PatternDetector::PatternDetector(std::string name, std::string attack_type,
                                 Severity severity, std::string description,
                                 const std::vector<std::string> &patterns)
    : name_(std::move(name)), attack_type_(std::move(attack_type)),
      severity_(severity), description_(std::move(description)),
      matcher_(std::make_unique<Utils::AhoCorasick>(patterns)) {}

std::optional<Detection> PatternDetector::classify(const Event &event) {
  if (matcher_->pattern_count() == 0)
    return std::nullopt;

  std::string text = collect_searchable_text(event.payload);
  if (event.user_agent)
    text += *event.user_agent;

  auto matches = matcher_->find_all(text);
  if (matches.empty())
    return std::nullopt;

  LOG(LogLevel::DEBUG, LogComponent::DETECTOR,
      name_ << ": " << matches.size() << " signature(s) matched for "
            << event.source_ip);

  Detection detection;
  detection.attack_type = attack_type_;
  detection.severity = severity_;
  detection.description = description_;
  detection.evidence = {{"matched_patterns", matches}};
  return detection;
}
