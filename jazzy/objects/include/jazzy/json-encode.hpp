#pragma once

#include <string>
#include <string_view>

#include "jazzy/json-value.hpp"

namespace jazzy {

// Appends the compact JSON text of value to out.
// Non finite doubles, which have no JSON representation, are written as null.
void AppendJson(std::string& out, const JsonValue& value);

// Appends str as a quoted JSON string, escaping quotes, backslashes and control characters.
void AppendJsonString(std::string& out, std::string_view str);

inline std::string ToJson(const JsonValue& value) {
  std::string out;
  AppendJson(out, value);
  return out;
}

}  // namespace jazzy
