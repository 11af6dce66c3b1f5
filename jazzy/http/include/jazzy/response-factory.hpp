#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "jazzy/http-response.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/json-builder.hpp"
#include "jazzy/json-convert.hpp"
#include "jazzy/json-value.hpp"

namespace jazzy {

// Shortcuts for the responses handlers usually return.
class ResponseFactory {
 public:
  ResponseFactory() = delete;

  // JSON response from any value convertible to JSON (see ToJsonValue).
  template <class T>
  static HttpResponse Json(const T& value) {
    return HttpResponse::Json(ToJsonValue(value));
  }

  // JSON object response from alternating keys and values:
  //   ResponseFactory::Json("id", 42, "name", "John")
  // Throws jazzy::invalid_argument if the argument count is odd or if a key is not a string.
  template <class Key, class Value, class... Rest>
  static HttpResponse Json(Key&& key, Value&& value, Rest&&... rest) {
    return HttpResponse::Json(
        MakeJsonObject(std::forward<Key>(key), std::forward<Value>(value), std::forward<Rest>(rest)...));
  }

  // {"status": "success", "message": message}
  static HttpResponse Success(std::string_view message);

  // {"status": "success", "message": message, "data": data}
  template <class T>
  static HttpResponse Success(std::string_view message, const T& data) {
    return SuccessWithData(message, ToJsonValue(data));
  }

  // {"status": "error", "message": message} with the given status (400 by default).
  static HttpResponse Error(std::string_view message, http::StatusCode statusCode = http::StatusCodeBadRequest);

  static HttpResponse Text(std::string body) { return HttpResponse::Text(std::move(body)); }

  static HttpResponse Html(std::string body) { return HttpResponse::Html(std::move(body)); }

  static HttpResponse Redirect(std::string_view url) { return HttpResponse::Redirect(url); }

 private:
  static HttpResponse SuccessWithData(std::string_view message, JsonValue data);
};

}  // namespace jazzy
