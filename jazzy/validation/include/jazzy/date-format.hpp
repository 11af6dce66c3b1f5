#pragma once

#include <string_view>

namespace jazzy {

// Tells whether value is a valid calendar date written in format.
// Supported format letters: yyyy (4 digits year), yy (2 digits year), MM / M (month), dd / d (day of month),
// HH (hour), mm (minute), ss (second). Single quotes enclose literal text, any other character must match
// literally. The format should define the year, the month and the day, which are checked against the calendar
// (leap years included).
[[nodiscard]] bool MatchesDateFormat(std::string_view value, std::string_view format);

}  // namespace jazzy
