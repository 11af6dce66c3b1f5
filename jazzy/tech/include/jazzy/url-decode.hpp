#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace jazzy::url {

// Decodes in place the range [first, last), compacting percent-encoded sequences and translating '+' to plusAs.
// Returns a pointer to the new logical end of the decoded sequence, or nullptr on invalid encoding
// (truncated '%' or non hexadecimal digits), in which case the range is left in an unspecified state.
char* DecodeInPlace(char* first, char* last, char plusAs = ' ');

// Decodes a single application/x-www-form-urlencoded component ('+' means space).
// Returns std::nullopt on invalid percent encoding.
std::optional<std::string> DecodeFormComponent(std::string_view encoded);

}  // namespace jazzy::url
