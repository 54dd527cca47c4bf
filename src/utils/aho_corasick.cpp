#include "aho_corasick.hpp"

#include <queue>

namespace Utils {

unsigned char AhoCorasick::fold(char ch) {
  auto byte = static_cast<unsigned char>(ch);
  return (byte >= 'A' && byte <= 'Z') ? static_cast<unsigned char>(byte + 32)
                                      : byte;
}

AhoCorasick::AhoCorasick(const std::vector<std::string> &patterns) {
  nodes_.emplace_back();

  for (const auto &pattern : patterns) {
    if (pattern.empty())
      continue;
    State state = 0;
    for (char ch : pattern) {
      unsigned char byte = fold(ch);
      if (nodes_[state].next[byte] == 0) {
        nodes_[state].next[byte] = static_cast<State>(nodes_.size());
        nodes_.emplace_back();
      }
      state = nodes_[state].next[byte];
    }
    nodes_[state].ends.push_back(patterns_.size());
    patterns_.push_back(pattern);
  }

  // Breadth-first: every missing edge is redirected to where the failure
  // state would go, which turns the trie into a DFA.
  std::queue<State> pending;
  for (auto &child : nodes_[0].next)
    if (child != 0)
      pending.push(child);

  while (!pending.empty()) {
    State state = pending.front();
    pending.pop();
    Node &node = nodes_[state];
    const Node &fallback = nodes_[node.fail];
    node.report = node.ends.empty() ? fallback.report : state;

    for (size_t byte = 0; byte < node.next.size(); ++byte) {
      State child = node.next[byte];
      if (child == 0) {
        node.next[byte] = fallback.next[byte];
        continue;
      }
      nodes_[child].fail = fallback.next[byte];
      pending.push(child);
    }
  }
}

std::vector<std::string> AhoCorasick::find_all(std::string_view text) const {
  std::vector<std::string> found;
  std::vector<bool> seen(patterns_.size(), false);
  State state = 0;

  for (char ch : text) {
    state = step(state, ch);
    for (State hit = nodes_[state].report; hit != 0;
         hit = nodes_[nodes_[hit].fail].report) {
      for (size_t index : nodes_[hit].ends) {
        if (!seen[index]) {
          seen[index] = true;
          found.push_back(patterns_[index]);
        }
      }
    }
  }
  return found;
}

bool AhoCorasick::contains_any(std::string_view text) const {
  State state = 0;
  for (char ch : text) {
    state = step(state, ch);
    if (nodes_[state].report != 0)
      return true;
  }
  return false;
}

} // namespace Utils
