#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "jazzy/http-method.hpp"
#include "jazzy/invalid-argument-exception.hpp"
#include "jazzy/json-convert.hpp"
#include "jazzy/json-decode.hpp"
#include "jazzy/json-value.hpp"
#include "jazzy/rule-set.hpp"
#include "jazzy/validation-result.hpp"
#include "jazzy/validator.hpp"

namespace jazzy {

using StringMap = std::map<std::string, std::string, std::less<>>;

// Parsed HTTP request handed to handlers. Immutable after construction.
// Header names are lower-cased at construction, header lookups are thus case insensitive.
class HttpRequest {
 public:
  HttpRequest(http::Method method, std::string path, StringMap headers, StringMap pathParams, StringMap queryParams,
              std::string body);

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  [[nodiscard]] std::string_view methodStr() const noexcept { return http::MethodToStr(_method); }

  // Request path, without the query string.
  [[nodiscard]] std::string_view pathString() const noexcept { return _path; }

  [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
  [[nodiscard]] std::string_view header(std::string_view name, std::string_view defaultValue) const;

  // Value of the path parameter captured by the {name} segment of the matched route.
  [[nodiscard]] std::optional<std::string_view> path(std::string_view name) const noexcept;
  [[nodiscard]] std::string_view path(std::string_view name, std::string_view defaultValue) const noexcept;

  [[nodiscard]] std::optional<std::string_view> query(std::string_view name) const noexcept;
  [[nodiscard]] std::string_view query(std::string_view name, std::string_view defaultValue) const noexcept;

  // Query parameter as an int, defaultValue if absent or not an integer.
  [[nodiscard]] int queryInt(std::string_view name, int defaultValue) const noexcept;

  // Query parameter as a bool ("true" or "false", case insensitive), defaultValue if absent or anything else.
  [[nodiscard]] bool queryBoolean(std::string_view name, bool defaultValue) const noexcept;

  [[nodiscard]] const StringMap& headers() const noexcept { return _headers; }
  [[nodiscard]] const StringMap& pathParams() const noexcept { return _pathParams; }
  [[nodiscard]] const StringMap& queryParams() const noexcept { return _queryParams; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Decodes the body as a JSON object. A blank body gives an empty object.
  // Throws jazzy::malformed_body if the body is not a JSON object.
  [[nodiscard]] JsonObject parseJson() const;

  // Decodes the JSON body into T, which should declare its fields with for_each_field (see FromJsonValue).
  // Members absent from T are ignored. Throws jazzy::invalid_argument if the body is empty,
  // jazzy::malformed_body if it is not valid JSON or does not fit T.
  template <class T>
  [[nodiscard]] T toObject() const {
    if (_body.empty()) {
      throw invalid_argument("Request body is empty");
    }
    JsonParseResult result = ParseJson(_body);
    if (!result.ok()) {
      throw malformed_body("Invalid JSON body: {}", result.error);
    }
    T obj{};
    try {
      FromJsonValue(result.value, obj);
    } catch (const invalid_argument& ex) {
      throw malformed_body("Invalid JSON body: {}", ex.what());
    }
    return obj;
  }

  // Document validated by validator() and validate(): query parameters, overridden by the members of the JSON
  // body when the Content-Type is JSON. An invalid JSON body is ignored here.
  [[nodiscard]] JsonObject validationData() const;

  // Fluent validator bound to validationData().
  [[nodiscard]] Validator validator() const { return Validator(validationData()); }

  // Replays ruleSet against validationData().
  [[nodiscard]] ValidationResult validate(const RuleSet& ruleSet) const { return ruleSet.validate(validationData()); }

  // Throws jazzy::invalid_argument("Validation failed: {field=message, ...}") if validate(ruleSet) fails.
  void validateOrFail(const RuleSet& ruleSet) const;

 private:
  std::string _path;
  StringMap _headers;
  StringMap _pathParams;
  StringMap _queryParams;
  std::string _body;
  http::Method _method;
};

}  // namespace jazzy
