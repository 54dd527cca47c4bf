#ifndef PATTERN_DETECTOR_HPP
#define PATTERN_DETECTOR_HPP

#include "detection/detector.hpp"
#include "utils/aho_corasick.hpp"

#include <memory>
#include <string>
#include <vector>

// Flags events whose payload strings contain any of a set of signatures.
// Used for both the SQL injection and the XSS stages.
class PatternDetector : public IDetector {
public:
  PatternDetector(std::string name, std::string attack_type, Severity severity,
                  std::string description,
                  const std::vector<std::string> &patterns);

  std::optional<Detection> classify(const Event &event) override;
  const char *get_name() const override { return name_.c_str(); }

private:
  const std::string name_;
  const std::string attack_type_;
  const Severity severity_;
  const std::string description_;
  std::unique_ptr<Utils::AhoCorasick> matcher_;
};

// Every string value and object key inside a JSON document, one per line.
std::string collect_searchable_text(const nlohmann::json &node);

#endif // PATTERN_DETECTOR_HPP
