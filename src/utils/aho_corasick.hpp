#ifndef AHO_CORASICK_HPP
#define AHO_CORASICK_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {

// Multi-pattern matcher compiled into a full transition table, so matching
// costs one lookup per input byte. ASCII letters are folded to lower case on
// both sides; other bytes match exactly. Empty patterns are dropped.
class AhoCorasick {
public:
  explicit AhoCorasick(const std::vector<std::string> &patterns);

  // Distinct patterns found in text, in order of first match, as given to
  // the constructor.
  std::vector<std::string> find_all(std::string_view text) const;
  bool contains_any(std::string_view text) const;
  size_t pattern_count() const { return patterns_.size(); }

private:
  using State = uint32_t;

  struct Node {
    std::array<State, 256> next{}; // 0 doubles as "no edge" while building
    State fail = 0;
    // Nearest state on the fail chain (itself included) that ends a
    // pattern, 0 when none does.
    State report = 0;
    std::vector<size_t> ends; // patterns ending exactly here
  };

  static unsigned char fold(char ch);
  State step(State state, char ch) const {
    return nodes_[state].next[fold(ch)];
  }

  std::vector<Node> nodes_;
  std::vector<std::string> patterns_;
};

} // namespace Utils

#endif // AHO_CORASICK_HPP
