#include "jazzy/validation-result.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "jazzy/json-value.hpp"

namespace jazzy {

void ValidationResult::addError(std::string_view field, std::string message) {
  auto it = _errors.find(field);
  if (it == _errors.end()) {
    it = _errors.emplace(std::string(field), std::vector<std::string>{}).first;
  }
  it->second.push_back(std::move(message));
}

std::span<const std::string> ValidationResult::fieldErrors(std::string_view field) const noexcept {
  auto it = _errors.find(field);
  if (it == _errors.end()) {
    return {};
  }
  return it->second;
}

std::optional<std::string_view> ValidationResult::firstError(std::string_view field) const noexcept {
  auto messages = fieldErrors(field);
  if (messages.empty()) {
    return std::nullopt;
  }
  return messages.front();
}

std::map<std::string, std::string, std::less<>> ValidationResult::firstErrors() const {
  std::map<std::string, std::string, std::less<>> ret;
  for (const auto& [field, messages] : _errors) {
    if (!messages.empty()) {
      ret.emplace(field, messages.front());
    }
  }
  return ret;
}

std::string ValidationResult::firstErrorsString() const {
  std::string ret(1, '{');
  for (const auto& [field, message] : firstErrors()) {
    if (ret.size() > 1) {
      ret.append(", ");
    }
    ret.append(field).append(1, '=').append(message);
  }
  ret.push_back('}');
  return ret;
}

std::size_t ValidationResult::errorCount() const noexcept {
  std::size_t count = 0;
  for (const auto& [field, messages] : _errors) {
    count += messages.size();
  }
  return count;
}

ValidationResult& ValidationResult::merge(const ValidationResult& other) {
  for (const auto& [field, messages] : other._errors) {
    for (const std::string& message : messages) {
      addError(field, message);
    }
  }
  return *this;
}

JsonObject ValidationResult::errorsJson() const {
  JsonObject obj;
  for (const auto& [field, messages] : _errors) {
    JsonArray arr(messages.begin(), messages.end());
    obj.add(field, std::move(arr));
  }
  return obj;
}

}  // namespace jazzy
