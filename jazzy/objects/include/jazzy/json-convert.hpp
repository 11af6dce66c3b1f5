#pragma once

#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "jazzy/invalid-argument-exception.hpp"
#include "jazzy/json-value.hpp"
#include "jazzy/stringconv.hpp"
#include "jazzy/string-equal-ignore-case.hpp"

namespace jazzy {

// Types declaring their own field set through a for_each_field member, as in:
//   template <class F> void for_each_field(F&& fun) const { fun("id", id); fun("name", name); }
// A const overload makes the type encodable as a JSON object, a non const overload makes it decodable.
template <class T>
concept JsonFieldEnumerable = requires(const T& obj) { obj.for_each_field([](std::string_view, const auto&) {}); };

template <class T>
concept JsonMapLike = requires {
  typename T::key_type;
  typename T::mapped_type;
} && std::convertible_to<const typename T::key_type&, std::string_view> && std::ranges::input_range<T>;

namespace detail {

template <class T>
inline constexpr bool kIsOptional = false;

template <class T>
inline constexpr bool kIsOptional<std::optional<T>> = true;

template <class>
inline constexpr bool kAlwaysFalse = false;

}  // namespace detail

// Converts value to a JsonValue: scalars and strings directly, map-like containers to objects, other ranges to
// arrays, std::optional to null or its contents, and JsonFieldEnumerable types to objects.
template <class T>
JsonValue ToJsonValue(const T& value) {
  if constexpr (std::is_constructible_v<JsonValue, const T&>) {
    return JsonValue(value);
  } else if constexpr (JsonFieldEnumerable<T>) {
    JsonObject obj;
    value.for_each_field(
        [&obj](std::string_view name, const auto& field) { obj.add(std::string(name), ToJsonValue(field)); });
    return obj;
  } else if constexpr (detail::kIsOptional<T>) {
    return value ? ToJsonValue(*value) : JsonValue();
  } else if constexpr (JsonMapLike<T>) {
    JsonObject obj;
    for (const auto& [key, mapped] : value) {
      obj.add(std::string(std::string_view(key)), ToJsonValue(mapped));
    }
    return obj;
  } else if constexpr (std::ranges::input_range<T>) {
    JsonArray arr;
    for (const auto& elem : value) {
      arr.push_back(ToJsonValue(elem));
    }
    return arr;
  } else {
    static_assert(detail::kAlwaysFalse<T>, "type is not convertible to JSON, consider adding for_each_field");
  }
}

// Assigns src into out, applying the usual coercions of loosely typed JSON payloads:
// strings are parsed into numbers and booleans when out is numeric or boolean ("true" in any case is true,
// anything else false). Null members leave the corresponding fields untouched.
// Throws jazzy::invalid_argument when src cannot be represented as T.
template <class T>
void FromJsonValue(const JsonValue& src, T& out) {
  if constexpr (std::same_as<T, JsonValue>) {
    out = src;
  } else if constexpr (std::same_as<T, std::string>) {
    out = src.asString();
  } else if constexpr (std::same_as<T, bool>) {
    if (src.isString()) {
      out = CaseInsensitiveEqual(src.asString(), "true");
    } else {
      out = src.asBool();
    }
  } else if constexpr (std::integral<T>) {
    if (src.isString()) {
      auto parsed = TryStringToIntegral<T>(src.asString());
      if (!parsed) {
        throw invalid_argument("'{}' is not a valid integer", src.asString());
      }
      out = *parsed;
    } else {
      const int64_t val = src.asInt();
      if (!std::in_range<T>(val)) {
        throw invalid_argument("{} is out of range", val);
      }
      out = static_cast<T>(val);
    }
  } else if constexpr (std::floating_point<T>) {
    if (src.isString()) {
      auto parsed = TryStringToDouble(src.asString());
      if (!parsed) {
        throw invalid_argument("'{}' is not a valid number", src.asString());
      }
      out = static_cast<T>(*parsed);
    } else {
      out = static_cast<T>(src.asDouble());
    }
  } else if constexpr (detail::kIsOptional<T>) {
    if (src.isNull()) {
      out.reset();
    } else {
      typename T::value_type val{};
      FromJsonValue(src, val);
      out = std::move(val);
    }
  } else if constexpr (JsonFieldEnumerable<T>) {
    const JsonObject& obj = src.asObject();
    out.for_each_field([&obj](std::string_view name, auto& field) {
      const JsonValue* member = obj.find(name);
      if (member == nullptr || member->isNull()) {
        return;
      }
      try {
        FromJsonValue(*member, field);
      } catch (const invalid_argument& ex) {
        throw invalid_argument("field '{}': {}", name, ex.what());
      }
    });
  } else if constexpr (requires(T& container, typename T::value_type elem) { container.push_back(std::move(elem)); }) {
    out.clear();
    for (const JsonValue& elem : src.asArray()) {
      typename T::value_type val{};
      FromJsonValue(elem, val);
      out.push_back(std::move(val));
    }
  } else {
    static_assert(detail::kAlwaysFalse<T>, "type is not decodable from JSON, consider adding for_each_field");
  }
}

}  // namespace jazzy
