#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jazzy {

class JsonValue;
struct JsonMember;

using JsonArray = std::vector<JsonValue>;

// JSON object keeping its members in insertion order. Keys are unique.
class JsonObject {
 public:
  using Members = std::vector<JsonMember>;
  using const_iterator = Members::const_iterator;

  JsonObject() = default;

  JsonObject(std::initializer_list<JsonMember> members);

  // Sets key to value. If key is already present its value is replaced in place, otherwise the member is appended.
  JsonObject& add(std::string key, JsonValue value);

  // Copies all members of other into this object, other's values winning on key collision.
  JsonObject& merge(const JsonObject& other);

  // Removes key if present. Returns true if a member was removed.
  bool erase(std::string_view key);

  [[nodiscard]] const JsonValue* find(std::string_view key) const noexcept;
  [[nodiscard]] JsonValue* find(std::string_view key) noexcept;

  [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;

  [[nodiscard]] const_iterator begin() const noexcept;
  [[nodiscard]] const_iterator end() const noexcept;

  // Order independent comparison.
  bool operator==(const JsonObject& other) const;

 private:
  Members _members;
};

// Dynamically typed JSON value. Integers and floating point numbers are kept apart so that decoded documents
// remember whether a number had a fractional part.
class JsonValue {
 public:
  using Storage = std::variant<std::nullptr_t, bool, int64_t, double, std::string, JsonArray, JsonObject>;

  JsonValue() noexcept = default;

  JsonValue(std::nullptr_t) noexcept {}

  JsonValue(bool val) noexcept : _storage(val) {}

  template <std::integral T>
    requires(!std::same_as<T, bool> && !std::same_as<T, char>)
  JsonValue(T val) noexcept : _storage(static_cast<int64_t>(val)) {}

  template <std::floating_point T>
  JsonValue(T val) noexcept : _storage(static_cast<double>(val)) {}

  JsonValue(char) = delete;

  JsonValue(const char* str) : _storage(std::string(str)) {}

  JsonValue(std::string_view str) : _storage(std::string(str)) {}

  JsonValue(std::string str) noexcept : _storage(std::move(str)) {}

  JsonValue(JsonArray arr) noexcept : _storage(std::move(arr)) {}

  JsonValue(JsonObject obj) noexcept : _storage(std::move(obj)) {}

  [[nodiscard]] bool isNull() const noexcept { return std::holds_alternative<std::nullptr_t>(_storage); }
  [[nodiscard]] bool isBool() const noexcept { return std::holds_alternative<bool>(_storage); }
  [[nodiscard]] bool isInt() const noexcept { return std::holds_alternative<int64_t>(_storage); }
  [[nodiscard]] bool isDouble() const noexcept { return std::holds_alternative<double>(_storage); }
  [[nodiscard]] bool isNumber() const noexcept { return isInt() || isDouble(); }
  [[nodiscard]] bool isString() const noexcept { return std::holds_alternative<std::string>(_storage); }
  [[nodiscard]] bool isArray() const noexcept { return std::holds_alternative<JsonArray>(_storage); }
  [[nodiscard]] bool isObject() const noexcept { return std::holds_alternative<JsonObject>(_storage); }

  // Typed accessors. They throw jazzy::invalid_argument if the value does not hold the requested type.
  // asDouble() also accepts integers.
  [[nodiscard]] bool asBool() const;
  [[nodiscard]] int64_t asInt() const;
  [[nodiscard]] double asDouble() const;
  [[nodiscard]] const std::string& asString() const;
  [[nodiscard]] const JsonArray& asArray() const;
  [[nodiscard]] JsonArray& asArray();
  [[nodiscard]] const JsonObject& asObject() const;
  [[nodiscard]] JsonObject& asObject();

  // One of "null", "boolean", "integer", "number", "string", "array", "object".
  [[nodiscard]] std::string_view typeName() const noexcept;

  [[nodiscard]] const Storage& storage() const noexcept { return _storage; }

  bool operator==(const JsonValue& other) const;

 private:
  Storage _storage;
};

struct JsonMember {
  std::string key;
  JsonValue value;

  bool operator==(const JsonMember&) const = default;
};

inline std::size_t JsonObject::size() const noexcept { return _members.size(); }

inline bool JsonObject::empty() const noexcept { return _members.empty(); }

inline JsonObject::const_iterator JsonObject::begin() const noexcept { return _members.begin(); }

inline JsonObject::const_iterator JsonObject::end() const noexcept { return _members.end(); }

}  // namespace jazzy
