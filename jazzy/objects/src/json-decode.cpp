#include "jazzy/json-decode.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "jazzy/char-hexadecimal-converter.hpp"
#include "jazzy/json-value.hpp"

namespace jazzy {

namespace {

constexpr int kMaxDepth = 256;

constexpr bool IsJsonSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; }

constexpr bool IsTokenEnd(char ch) {
  return IsJsonSpace(ch) || ch == ',' || ch == ':' || ch == '}' || ch == ']' || ch == '{' || ch == '[' || ch == '"';
}

constexpr bool IsDigit(char ch) { return ch >= '0' && ch <= '9'; }

// Tells whether token is a number per the JSON grammar, and whether it has a fraction or an exponent.
bool IsJsonNumber(std::string_view token, bool& isIntegral) {
  std::size_t pos = 0;
  if (pos < token.size() && token[pos] == '-') {
    ++pos;
  }
  const std::size_t intBeg = pos;
  while (pos < token.size() && IsDigit(token[pos])) {
    ++pos;
  }
  if (pos == intBeg) {
    return false;
  }
  isIntegral = true;
  if (pos < token.size() && token[pos] == '.') {
    isIntegral = false;
    const std::size_t fracBeg = ++pos;
    while (pos < token.size() && IsDigit(token[pos])) {
      ++pos;
    }
    if (pos == fracBeg) {
      return false;
    }
  }
  if (pos < token.size() && (token[pos] == 'e' || token[pos] == 'E')) {
    isIntegral = false;
    ++pos;
    if (pos < token.size() && (token[pos] == '+' || token[pos] == '-')) {
      ++pos;
    }
    const std::size_t expBeg = pos;
    while (pos < token.size() && IsDigit(token[pos])) {
      ++pos;
    }
    if (pos == expBeg) {
      return false;
    }
  }
  return pos == token.size();
}

void AppendUtf8(std::string& out, uint32_t codePoint) {
  if (codePoint < 0x80) {
    out.push_back(static_cast<char>(codePoint));
  } else if (codePoint < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else if (codePoint < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
  }
}

class JsonParser {
 public:
  explicit JsonParser(std::string_view text) noexcept : _text(text) {}

  JsonParseResult run() {
    JsonParseResult result;
    skipSpaces();
    if (atEnd()) {
      fail("empty document");
    } else if (parseValue(result.value, 0)) {
      skipSpaces();
      if (!atEnd()) {
        fail("unexpected characters after the document");
      }
    }
    if (_error != nullptr) {
      result.value = JsonValue();
      result.error = _error;
      result.errorOffset = _errorPos;
    }
    return result;
  }

 private:
  bool atEnd() const noexcept { return _pos >= _text.size(); }

  char peek() const noexcept { return _text[_pos]; }

  void skipSpaces() noexcept {
    while (!atEnd() && IsJsonSpace(peek())) {
      ++_pos;
    }
  }

  bool fail(const char* msg) noexcept {
    if (_error == nullptr) {
      _error = msg;
      _errorPos = _pos;
    }
    return false;
  }

  bool parseValue(JsonValue& out, int depth) {
    if (depth > kMaxDepth) {
      return fail("maximum nesting depth exceeded");
    }
    skipSpaces();
    if (atEnd()) {
      return fail("unexpected end of document");
    }
    switch (peek()) {
      case '{':
        return parseObject(out, depth);
      case '[':
        return parseArray(out, depth);
      case '"': {
        std::string str;
        if (!parseString(str)) {
          return false;
        }
        out = JsonValue(std::move(str));
        return true;
      }
      default:
        return parseToken(out);
    }
  }

  bool parseObject(JsonValue& out, int depth) {
    ++_pos;  // '{'
    JsonObject obj;
    skipSpaces();
    if (!atEnd() && peek() == '}') {
      ++_pos;
      out = JsonValue(std::move(obj));
      return true;
    }
    while (true) {
      skipSpaces();
      if (atEnd()) {
        return fail("unterminated object");
      }
      if (peek() != '"') {
        return fail("expected a string key");
      }
      std::string key;
      if (!parseString(key)) {
        return false;
      }
      skipSpaces();
      if (atEnd() || peek() != ':') {
        return fail("missing ':' after object key");
      }
      ++_pos;
      JsonValue value;
      if (!parseValue(value, depth + 1)) {
        return false;
      }
      obj.add(std::move(key), std::move(value));
      skipSpaces();
      if (atEnd()) {
        return fail("unterminated object");
      }
      const char ch = peek();
      ++_pos;
      if (ch == '}') {
        break;
      }
      if (ch != ',') {
        --_pos;
        return fail("expected ',' or '}' in object");
      }
    }
    out = JsonValue(std::move(obj));
    return true;
  }

  bool parseArray(JsonValue& out, int depth) {
    ++_pos;  // '['
    JsonArray arr;
    skipSpaces();
    if (!atEnd() && peek() == ']') {
      ++_pos;
      out = JsonValue(std::move(arr));
      return true;
    }
    while (true) {
      JsonValue elem;
      if (!parseValue(elem, depth + 1)) {
        return false;
      }
      arr.push_back(std::move(elem));
      skipSpaces();
      if (atEnd()) {
        return fail("unterminated array");
      }
      const char ch = peek();
      ++_pos;
      if (ch == ']') {
        break;
      }
      if (ch != ',') {
        --_pos;
        return fail("expected ',' or ']' in array");
      }
    }
    out = JsonValue(std::move(arr));
    return true;
  }

  bool parseHex4(uint32_t& codeUnit) {
    if (_text.size() - _pos < 4) {
      return fail("truncated unicode escape");
    }
    codeUnit = 0;
    for (int idx = 0; idx < 4; ++idx) {
      const int digit = from_hex_digit(_text[_pos++]);
      if (digit < 0) {
        return fail("invalid unicode escape");
      }
      codeUnit = (codeUnit << 4) | static_cast<uint32_t>(digit);
    }
    return true;
  }

  bool parseString(std::string& out) {
    ++_pos;  // opening quote
    while (!atEnd()) {
      const char ch = _text[_pos++];
      if (ch == '"') {
        return true;
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (atEnd()) {
        break;
      }
      const char esc = _text[_pos++];
      switch (esc) {
        case '"':
        case '\\':
        case '/':
          out.push_back(esc);
          break;
        case 'b':
          out.push_back('\b');
          break;
        case 'f':
          out.push_back('\f');
          break;
        case 'n':
          out.push_back('\n');
          break;
        case 'r':
          out.push_back('\r');
          break;
        case 't':
          out.push_back('\t');
          break;
        case 'u': {
          uint32_t codePoint;
          if (!parseHex4(codePoint)) {
            return false;
          }
          if (codePoint >= 0xD800 && codePoint <= 0xDBFF) {
            uint32_t low;
            if (_text.substr(_pos, 2) != "\\u") {
              return fail("unpaired surrogate in unicode escape");
            }
            _pos += 2;
            if (!parseHex4(low)) {
              return false;
            }
            if (low < 0xDC00 || low > 0xDFFF) {
              return fail("unpaired surrogate in unicode escape");
            }
            codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (low - 0xDC00);
          }
          AppendUtf8(out, codePoint);
          break;
        }
        default:
          --_pos;
          return fail("invalid escape sequence");
      }
    }
    return fail("unterminated string");
  }

  bool parseToken(JsonValue& out) {
    const std::size_t beg = _pos;
    while (!atEnd() && !IsTokenEnd(peek())) {
      ++_pos;
    }
    const std::string_view token = _text.substr(beg, _pos - beg);
    if (token.empty()) {
      return fail("unexpected character");
    }
    if (token == "null") {
      out = JsonValue();
    } else if (token == "true") {
      out = JsonValue(true);
    } else if (token == "false") {
      out = JsonValue(false);
    } else if (bool isIntegral; IsJsonNumber(token, isIntegral)) {
      out = decodeNumber(token, isIntegral);
    } else {
      out = JsonValue(token);
    }
    return true;
  }

  static JsonValue decodeNumber(std::string_view token, bool isIntegral) {
    const char* endPtr = token.data() + token.size();
    if (isIntegral) {
      int64_t intVal;
      const auto [ptr, errc] = std::from_chars(token.data(), endPtr, intVal);
      if (errc == std::errc() && ptr == endPtr) {
        return intVal;
      }
    }
    double dblVal{};
    const auto [ptr, errc] = std::from_chars(token.data(), endPtr, dblVal);
    if (errc == std::errc::result_out_of_range) {
      // too large magnitudes saturate, too small ones vanish
      const bool tiny = token.find_first_of("eE") != std::string_view::npos &&
                        token[token.find_first_of("eE") + 1] == '-';
      const double magnitude = tiny ? 0.0 : std::numeric_limits<double>::infinity();
      return token.front() == '-' ? -magnitude : magnitude;
    }
    return dblVal;
  }

  std::string_view _text;
  std::size_t _pos{};
  const char* _error{};
  std::size_t _errorPos{};
};

}  // namespace

JsonParseResult ParseJson(std::string_view text) { return JsonParser(text).run(); }

}  // namespace jazzy
