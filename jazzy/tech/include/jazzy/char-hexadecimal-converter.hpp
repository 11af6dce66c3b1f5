#pragma once

namespace jazzy {

// Returns the value of a hexadecimal digit, or -1 if ch is not one.
constexpr int from_hex_digit(char ch) noexcept {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

}  // namespace jazzy
