#pragma once

#include <charconv>
#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace jazzy {

// Decodes the whole of str (an optional sign followed by decimal digits) into an integral.
// Returns std::nullopt if str is empty, contains anything else or does not fit into Integral.
template <std::integral Integral>
std::optional<Integral> TryStringToIntegral(std::string_view str) noexcept {
  if (!str.empty() && str.front() == '+') {
    str.remove_prefix(1);
    if (!str.empty() && str.front() == '-') {
      return std::nullopt;
    }
  }
  Integral ret;
  const char* endPtr = str.data() + str.size();
  const auto [ptr, errc] = std::from_chars(str.data(), endPtr, ret);
  if (errc != std::errc() || ptr != endPtr || str.empty()) {
    return std::nullopt;
  }
  return ret;
}

// Decodes str as a floating point number. Leading and trailing blanks are ignored, as well as a leading '+'.
// Returns std::nullopt if str is not entirely a number.
std::optional<double> TryStringToDouble(std::string_view str) noexcept;

// Appends the shortest decimal representation of val that reads back to the same double.
// Values with an integral representation keep a trailing ".0" so that they are never confused with integers.
void AppendDouble(std::string& out, double val);

inline std::string DoubleToString(double val) {
  std::string ret;
  AppendDouble(ret, val);
  return ret;
}

}  // namespace jazzy
