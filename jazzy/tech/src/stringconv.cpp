#include "jazzy/stringconv.hpp"

#include <charconv>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "jazzy/string-trim.hpp"

namespace jazzy {

std::optional<double> TryStringToDouble(std::string_view str) noexcept {
  str = TrimBlank(str);
  if (!str.empty() && str.front() == '+') {
    str.remove_prefix(1);
    if (!str.empty() && str.front() == '-') {
      return std::nullopt;
    }
  }
  if (str.empty()) {
    return std::nullopt;
  }
  double ret;
  const char* endPtr = str.data() + str.size();
  const auto [ptr, errc] = std::from_chars(str.data(), endPtr, ret);
  if (errc != std::errc() || ptr != endPtr) {
    return std::nullopt;
  }
  return ret;
}

void AppendDouble(std::string& out, double val) {
  // 24 chars is enough for the shortest round trip representation of any double
  char buf[32];
  const auto [ptr, errc] = std::to_chars(buf, buf + sizeof(buf), val);
  std::string_view repr(buf, errc == std::errc() ? static_cast<std::size_t>(ptr - buf) : 0U);
  out.append(repr);
  if (std::isfinite(val) && repr.find_first_of(".e") == std::string_view::npos) {
    out.append(".0");
  }
}

}  // namespace jazzy
