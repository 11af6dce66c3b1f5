#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "jazzy/json-value.hpp"

namespace jazzy {

struct JsonParseResult {
  JsonValue value;
  // Empty on success, otherwise the reason why the document was rejected.
  std::string error;
  // Offset in the input where the error was detected.
  std::size_t errorOffset{};

  [[nodiscard]] bool ok() const noexcept { return error.empty(); }
};

// Decodes a JSON document. The whole input must be consumed (surrounding whitespace excepted).
// Numbers without fraction nor exponent that fit into int64_t are decoded as integers, other numbers as doubles.
// Unquoted tokens that are neither literals nor numbers (as in {"role": admin}) are accepted and decoded as strings.
// Never throws on malformed input: the error is reported in the returned result.
[[nodiscard]] JsonParseResult ParseJson(std::string_view text);

}  // namespace jazzy
