#pragma once

#include <string_view>

namespace jazzy {

// Trim OWS (optional whitespace) per RFC7230: SP and HTAB only.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) {
    sv.remove_suffix(1);
  }
  return sv;
}

// Trim all ASCII control characters and spaces (code points <= 0x20) at both ends.
constexpr std::string_view TrimBlank(std::string_view sv) noexcept {
  while (!sv.empty() && static_cast<unsigned char>(sv.front()) <= ' ') {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && static_cast<unsigned char>(sv.back()) <= ' ') {
    sv.remove_suffix(1);
  }
  return sv;
}

constexpr bool IsBlank(std::string_view sv) noexcept { return TrimBlank(sv).empty(); }

}  // namespace jazzy
