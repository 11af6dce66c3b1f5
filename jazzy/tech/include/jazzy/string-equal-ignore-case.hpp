#pragma once

#include <cstddef>
#include <string_view>

#include "jazzy/toupperlower.hpp"

namespace jazzy {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

// Tells whether needle appears in haystack, ignoring ASCII case.
constexpr bool CaseInsensitiveContains(std::string_view haystack, std::string_view needle) {
  if (needle.size() > haystack.size()) {
    return false;
  }
  const std::size_t lastStart = haystack.size() - needle.size();
  for (std::size_t start = 0; start <= lastStart; ++start) {
    if (CaseInsensitiveEqual(haystack.substr(start, needle.size()), needle)) {
      return true;
    }
  }
  return false;
}

struct CaseInsensitiveLessFunc {
  using is_transparent = void;

  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    const std::size_t minSize = lhs.size() < rhs.size() ? lhs.size() : rhs.size();
    for (std::size_t pos = 0; pos < minSize; ++pos) {
      const auto lc = tolower(lhs[pos]);
      const auto rc = tolower(rhs[pos]);
      if (lc != rc) {
        return lc < rc;
      }
    }
    return lhs.size() < rhs.size();
  }
};

}  // namespace jazzy
