#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "jazzy/http-response.hpp"
#include "jazzy/json-convert.hpp"
#include "jazzy/json-value.hpp"
#include "jazzy/validation-result.hpp"

namespace jazzy {

class HandlerResult;

// Values a handler may return to be serialized as a JSON document.
template <class T>
concept JsonResult =
    !std::convertible_to<const T&, std::string_view> && !std::same_as<std::remove_cvref_t<T>, HttpResponse> &&
    !std::same_as<std::remove_cvref_t<T>, ValidationResult> && !std::same_as<std::remove_cvref_t<T>, HandlerResult> &&
    requires(const T& value) { ToJsonValue(value); };

// What a request handler returns:
//  - an HttpResponse, sent as is
//  - a string, sent as a 200 text/plain response
//  - a ValidationResult, sent as a 200 JSON success marker if valid, as a 422 error listing the first error
//    of each field otherwise
//  - any other value convertible to JSON, sent as a 200 application/json response
class HandlerResult {
 public:
  HandlerResult(HttpResponse response) noexcept : _value(std::move(response)) {}

  HandlerResult(std::string text) noexcept : _value(std::move(text)) {}

  HandlerResult(const char* text) : _value(std::string(text)) {}

  HandlerResult(std::string_view text) : _value(std::string(text)) {}

  HandlerResult(ValidationResult result) noexcept : _value(std::move(result)) {}

  HandlerResult(JsonValue value) noexcept : _value(std::move(value)) {}

  template <JsonResult T>
    requires(!std::same_as<std::remove_cvref_t<T>, JsonValue>)
  HandlerResult(const T& value) : _value(ToJsonValue(value)) {}

  [[nodiscard]] HttpResponse toResponse() &&;

 private:
  std::variant<HttpResponse, std::string, ValidationResult, JsonValue> _value;
};

}  // namespace jazzy
