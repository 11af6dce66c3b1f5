#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "jazzy/invalid-argument-exception.hpp"
#include "jazzy/json-convert.hpp"
#include "jazzy/json-value.hpp"

namespace jazzy {

namespace detail {

inline void AppendKeyValues(JsonObject&) {}

template <class Key, class Value, class... Rest>
void AppendKeyValues(JsonObject& obj, Key&& key, Value&& value, Rest&&... rest) {
  if constexpr (!std::is_convertible_v<Key, std::string_view>) {
    throw invalid_argument("Keys must be strings");
  } else {
    obj.add(std::string(std::string_view(key)), ToJsonValue(value));
    AppendKeyValues(obj, std::forward<Rest>(rest)...);
  }
}

}  // namespace detail

// Builds an ordered JSON object from alternating keys and values:
//   MakeJsonObject("id", 42, "name", "John", "roles", std::vector<std::string>{"admin"})
// Throws jazzy::invalid_argument if the number of arguments is odd or if a key is not a string.
template <class... Args>
JsonObject MakeJsonObject(Args&&... keyValues) {
  if constexpr (sizeof...(Args) % 2 != 0) {
    throw invalid_argument("Must provide an even number of arguments");
  } else {
    JsonObject obj;
    detail::AppendKeyValues(obj, std::forward<Args>(keyValues)...);
    return obj;
  }
}

// Builds a JSON array from heterogeneous values.
template <class... Args>
JsonArray MakeJsonArray(Args&&... values) {
  JsonArray arr;
  arr.reserve(sizeof...(Args));
  (arr.push_back(ToJsonValue(values)), ...);
  return arr;
}

}  // namespace jazzy
