#include "jazzy/json-encode.hpp"

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "jazzy/json-value.hpp"
#include "jazzy/stringconv.hpp"

namespace jazzy {

void AppendJsonString(std::string& out, std::string_view str) {
  static constexpr char kHexDigits[] = "0123456789abcdef";

  out.push_back('"');
  for (char ch : str) {
    switch (ch) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      case '\r':
        out.append("\\r");
        break;
      case '\t':
        out.append("\\t");
        break;
      case '\b':
        out.append("\\b");
        break;
      case '\f':
        out.append("\\f");
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          const auto code = static_cast<unsigned char>(ch);
          out.append("\\u00");
          out.push_back(kHexDigits[code >> 4]);
          out.push_back(kHexDigits[code & 0xF]);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
  out.push_back('"');
}

void AppendJson(std::string& out, const JsonValue& value) {
  std::visit(
      [&out](const auto& val) {
        using T = std::remove_cvref_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          out.append("null");
        } else if constexpr (std::is_same_v<T, bool>) {
          out.append(val ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
          char buf[24];
          const auto res = std::to_chars(buf, buf + sizeof(buf), val);
          out.append(buf, res.ptr);
        } else if constexpr (std::is_same_v<T, double>) {
          if (std::isfinite(val)) {
            AppendDouble(out, val);
          } else {
            out.append("null");
          }
        } else if constexpr (std::is_same_v<T, std::string>) {
          AppendJsonString(out, val);
        } else if constexpr (std::is_same_v<T, JsonArray>) {
          out.push_back('[');
          for (std::size_t pos = 0; pos < val.size(); ++pos) {
            if (pos != 0) {
              out.push_back(',');
            }
            AppendJson(out, val[pos]);
          }
          out.push_back(']');
        } else {
          out.push_back('{');
          bool first = true;
          for (const JsonMember& member : val) {
            if (!first) {
              out.push_back(',');
            }
            first = false;
            AppendJsonString(out, member.key);
            out.push_back(':');
            AppendJson(out, member.value);
          }
          out.push_back('}');
        }
      },
      value.storage());
}

}  // namespace jazzy
