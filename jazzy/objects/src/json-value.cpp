#include "jazzy/json-value.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "jazzy/invalid-argument-exception.hpp"

namespace jazzy {

JsonObject::JsonObject(std::initializer_list<JsonMember> members) {
  _members.reserve(members.size());
  for (const JsonMember& member : members) {
    add(member.key, member.value);
  }
}

JsonObject& JsonObject::add(std::string key, JsonValue value) {
  JsonValue* existing = find(key);
  if (existing != nullptr) {
    *existing = std::move(value);
  } else {
    _members.push_back(JsonMember{std::move(key), std::move(value)});
  }
  return *this;
}

JsonObject& JsonObject::merge(const JsonObject& other) {
  for (const JsonMember& member : other) {
    add(member.key, member.value);
  }
  return *this;
}

bool JsonObject::erase(std::string_view key) {
  const auto it = std::ranges::find(_members, key, &JsonMember::key);
  if (it == _members.end()) {
    return false;
  }
  _members.erase(it);
  return true;
}

const JsonValue* JsonObject::find(std::string_view key) const noexcept {
  const auto it = std::ranges::find(_members, key, &JsonMember::key);
  return it == _members.end() ? nullptr : &it->value;
}

JsonValue* JsonObject::find(std::string_view key) noexcept {
  const auto it = std::ranges::find(_members, key, &JsonMember::key);
  return it == _members.end() ? nullptr : &it->value;
}

bool JsonObject::operator==(const JsonObject& other) const {
  if (size() != other.size()) {
    return false;
  }
  return std::ranges::all_of(_members, [&other](const JsonMember& member) {
    const JsonValue* otherValue = other.find(member.key);
    return otherValue != nullptr && *otherValue == member.value;
  });
}

namespace {

template <class T>
const T& Get(const JsonValue::Storage& storage, std::string_view expected, std::string_view actual) {
  const T* ptr = std::get_if<T>(&storage);
  if (ptr == nullptr) {
    throw invalid_argument("JSON value is {} instead of {}", actual, expected);
  }
  return *ptr;
}

}  // namespace

bool JsonValue::asBool() const { return Get<bool>(_storage, "boolean", typeName()); }

int64_t JsonValue::asInt() const { return Get<int64_t>(_storage, "integer", typeName()); }

double JsonValue::asDouble() const {
  if (const auto* intVal = std::get_if<int64_t>(&_storage)) {
    return static_cast<double>(*intVal);
  }
  return Get<double>(_storage, "number", typeName());
}

const std::string& JsonValue::asString() const { return Get<std::string>(_storage, "string", typeName()); }

const JsonArray& JsonValue::asArray() const { return Get<JsonArray>(_storage, "array", typeName()); }

JsonArray& JsonValue::asArray() { return const_cast<JsonArray&>(std::as_const(*this).asArray()); }

const JsonObject& JsonValue::asObject() const { return Get<JsonObject>(_storage, "object", typeName()); }

JsonObject& JsonValue::asObject() { return const_cast<JsonObject&>(std::as_const(*this).asObject()); }

std::string_view JsonValue::typeName() const noexcept {
  static constexpr std::string_view kTypeNames[] = {"null",   "boolean", "integer", "number",
                                                    "string", "array",   "object"};
  return kTypeNames[_storage.index()];
}

bool JsonValue::operator==(const JsonValue& other) const { return _storage == other._storage; }

}  // namespace jazzy
