#include "jazzy/date-format.hpp"

#include <cstddef>
#include <string_view>

namespace jazzy {

namespace {

constexpr bool IsDigit(char ch) { return ch >= '0' && ch <= '9'; }

constexpr bool IsLeapYear(int year) { return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0); }

constexpr int DaysInMonth(int year, int month) {
  constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return month == 2 && IsLeapYear(year) ? 29 : kDays[month - 1];
}

// Parses between minDigits and maxDigits decimal digits of value starting at pos.
bool ReadNumber(std::string_view value, std::size_t& pos, std::size_t minDigits, std::size_t maxDigits, int& out) {
  std::size_t nbDigits = 0;
  out = 0;
  while (pos < value.size() && nbDigits < maxDigits && IsDigit(value[pos])) {
    out = (out * 10) + (value[pos] - '0');
    ++pos;
    ++nbDigits;
  }
  return nbDigits >= minDigits;
}

}  // namespace

bool MatchesDateFormat(std::string_view value, std::string_view format) {
  int year = -1;
  int month = -1;
  int day = -1;
  std::size_t pos = 0;
  std::size_t fpos = 0;
  while (fpos < format.size()) {
    const char letter = format[fpos];
    if (letter == '\'') {
      // quoted literal, '' standing for a single quote
      ++fpos;
      if (fpos < format.size() && format[fpos] == '\'') {
        if (pos >= value.size() || value[pos] != '\'') {
          return false;
        }
        ++pos;
        ++fpos;
        continue;
      }
      while (fpos < format.size() && format[fpos] != '\'') {
        if (pos >= value.size() || value[pos] != format[fpos]) {
          return false;
        }
        ++pos;
        ++fpos;
      }
      ++fpos;  // closing quote
      continue;
    }
    if ((letter < 'a' || letter > 'z') && (letter < 'A' || letter > 'Z')) {
      if (pos >= value.size() || value[pos] != letter) {
        return false;
      }
      ++pos;
      ++fpos;
      continue;
    }
    std::size_t count = 0;
    while (fpos < format.size() && format[fpos] == letter) {
      ++fpos;
      ++count;
    }
    const std::size_t minDigits = count;
    const std::size_t maxDigits = count == 1 ? 2 : count;
    int number;
    switch (letter) {
      case 'y':
        if (!ReadNumber(value, pos, minDigits, count == 1 ? 9 : maxDigits, number)) {
          return false;
        }
        year = count == 2 ? 2000 + number : number;
        break;
      case 'M':
        if (count > 2 || !ReadNumber(value, pos, minDigits, maxDigits, number) || number < 1 || number > 12) {
          return false;
        }
        month = number;
        break;
      case 'd':
        if (count > 2 || !ReadNumber(value, pos, minDigits, maxDigits, number) || number < 1 || number > 31) {
          return false;
        }
        day = number;
        break;
      case 'H':
        if (count > 2 || !ReadNumber(value, pos, minDigits, maxDigits, number) || number > 23) {
          return false;
        }
        break;
      case 'm':
        [[fallthrough]];
      case 's':
        if (count > 2 || !ReadNumber(value, pos, minDigits, maxDigits, number) || number > 59) {
          return false;
        }
        break;
      default:
        return false;
    }
  }
  if (pos != value.size() || year < 0 || month < 0 || day < 0) {
    return false;
  }
  return day <= DaysInMonth(year, month);
}

}  // namespace jazzy
