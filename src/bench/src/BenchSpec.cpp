/**
 * @file BenchSpec.cpp
 * @brief Benchmark name normalization.
 */

#include "src/bench/inc/BenchSpec.hpp"

namespace brunch {
namespace bench {

namespace {

bool isAsciiSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

} // namespace

std::string collapseWhitespace(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());

  bool pendingSpace = false;
  for (const char C : raw) {
    if (isAsciiSpace(C)) {
      pendingSpace = !out.empty();
      continue;
    }
    if (pendingSpace) {
      out.push_back(' ');
      pendingSpace = false;
    }
    out.push_back(C);
  }
  return out;
}

std::string normalizeName(std::string_view raw) {
  std::string name = collapseWhitespace(raw);
  if (name.empty()) {
    throw ConfigurationError("benchmark name is required");
  }
  if (name.size() > MAX_NAME_BYTES) {
    throw ConfigurationError("benchmark name is " + std::to_string(name.size()) +
                             " bytes; the limit is " + std::to_string(MAX_NAME_BYTES));
  }
  return name;
}

} // namespace bench
} // namespace brunch
