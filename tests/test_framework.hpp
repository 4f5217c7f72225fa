#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace archon::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

inline void require_contains(const std::string &text, const std::string &needle) {
  if (text.find(needle) == std::string::npos) {
    throw std::runtime_error("expected \"" + needle + "\" in:\n" + text);
  }
}

} // namespace archon::tests
