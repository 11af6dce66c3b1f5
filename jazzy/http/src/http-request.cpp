#include "jazzy/http-request.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "jazzy/http-constants.hpp"
#include "jazzy/http-method.hpp"
#include "jazzy/invalid-argument-exception.hpp"
#include "jazzy/json-decode.hpp"
#include "jazzy/json-value.hpp"
#include "jazzy/log.hpp"
#include "jazzy/rule-set.hpp"
#include "jazzy/string-equal-ignore-case.hpp"
#include "jazzy/string-trim.hpp"
#include "jazzy/stringconv.hpp"
#include "jazzy/tolower-str.hpp"
#include "jazzy/validation-result.hpp"

namespace jazzy {

namespace {

std::optional<std::string_view> Find(const StringMap& map, std::string_view key) noexcept {
  auto it = map.find(key);
  if (it == map.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace

HttpRequest::HttpRequest(http::Method method, std::string path, StringMap headers, StringMap pathParams,
                         StringMap queryParams, std::string body)
    : _path(std::move(path)),
      _pathParams(std::move(pathParams)),
      _queryParams(std::move(queryParams)),
      _body(std::move(body)),
      _method(method) {
  for (auto& [name, value] : headers) {
    _headers.insert_or_assign(ToLower(name), std::move(value));
  }
}

std::optional<std::string_view> HttpRequest::header(std::string_view name) const {
  return Find(_headers, ToLower(name));
}

std::string_view HttpRequest::header(std::string_view name, std::string_view defaultValue) const {
  return header(name).value_or(defaultValue);
}

std::optional<std::string_view> HttpRequest::path(std::string_view name) const noexcept {
  return Find(_pathParams, name);
}

std::string_view HttpRequest::path(std::string_view name, std::string_view defaultValue) const noexcept {
  return path(name).value_or(defaultValue);
}

std::optional<std::string_view> HttpRequest::query(std::string_view name) const noexcept {
  return Find(_queryParams, name);
}

std::string_view HttpRequest::query(std::string_view name, std::string_view defaultValue) const noexcept {
  return query(name).value_or(defaultValue);
}

int HttpRequest::queryInt(std::string_view name, int defaultValue) const noexcept {
  const auto value = query(name);
  if (!value) {
    return defaultValue;
  }
  return TryStringToIntegral<int>(*value).value_or(defaultValue);
}

bool HttpRequest::queryBoolean(std::string_view name, bool defaultValue) const noexcept {
  const auto value = query(name);
  if (!value) {
    return defaultValue;
  }
  if (CaseInsensitiveEqual(*value, "true")) {
    return true;
  }
  if (CaseInsensitiveEqual(*value, "false")) {
    return false;
  }
  return defaultValue;
}

JsonObject HttpRequest::parseJson() const {
  if (IsBlank(_body)) {
    return {};
  }
  JsonParseResult result = ParseJson(_body);
  if (!result.ok()) {
    throw malformed_body("Invalid JSON body: {} at offset {}", result.error, result.errorOffset);
  }
  if (!result.value.isObject()) {
    throw malformed_body("Invalid JSON body: expected an object, got {}", result.value.typeName());
  }
  return std::move(result.value.asObject());
}

JsonObject HttpRequest::validationData() const {
  JsonObject data;
  for (const auto& [name, value] : _queryParams) {
    data.add(name, value);
  }
  const auto contentType = header(http::ContentType);
  if (contentType && CaseInsensitiveContains(*contentType, http::ContentTypeApplicationJson) && !_body.empty()) {
    try {
      data.merge(parseJson());
    } catch (const malformed_body& ex) {
      log::debug("Ignoring invalid JSON body for validation: {}", ex.what());
    }
  }
  return data;
}

void HttpRequest::validateOrFail(const RuleSet& ruleSet) const {
  ValidationResult result = validate(ruleSet);
  if (result.failed()) {
    throw invalid_argument("Validation failed: {}", result.firstErrorsString());
  }
}

}  // namespace jazzy
