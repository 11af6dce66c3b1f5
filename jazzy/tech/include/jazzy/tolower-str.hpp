#pragma once

#include <string>
#include <string_view>

#include "jazzy/toupperlower.hpp"

namespace jazzy {

// Returns an ASCII lower-cased copy of str.
inline std::string ToLower(std::string_view str) {
  std::string ret(str);
  for (char& ch : ret) {
    ch = tolower(ch);
  }
  return ret;
}

// Returns an ASCII upper-cased copy of str.
inline std::string ToUpper(std::string_view str) {
  std::string ret(str);
  for (char& ch : ret) {
    ch = toupper(ch);
  }
  return ret;
}

}  // namespace jazzy
