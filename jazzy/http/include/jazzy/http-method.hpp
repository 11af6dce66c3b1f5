#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "jazzy/string-equal-ignore-case.hpp"

namespace jazzy::http {

// Methods served by the framework. Any other method is answered with 405 Method Not Allowed.
enum class Method : std::uint8_t { GET, POST, PUT, DELETE, PATCH };

inline constexpr std::size_t kNbMethods = 5;

inline constexpr std::string_view kMethodStrings[] = {"GET", "POST", "PUT", "DELETE", "PATCH"};

// Value of the Allow header sent along 405 responses.
inline constexpr std::string_view kAllowedMethods = "GET, POST, PUT, DELETE, PATCH";

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[static_cast<std::size_t>(method)]; }

// Case insensitive conversion of a method token, std::nullopt if the method is not supported.
constexpr std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  for (std::size_t methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (CaseInsensitiveEqual(kMethodStrings[methodIdx], str)) {
      return static_cast<Method>(methodIdx);
    }
  }
  return std::nullopt;
}

// Only POST, PUT and PATCH requests may (and must) carry a body.
constexpr bool MethodExpectsBody(Method method) {
  return method == Method::POST || method == Method::PUT || method == Method::PATCH;
}

}  // namespace jazzy::http
