#pragma once

#include <string_view>

#include "jazzy/http-response.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/json-value.hpp"

namespace jazzy {

// Structured error responses. The body is always the JSON object
//   {"status": <code>, "error": "<error>", "message": "<message>"}
// and the response status is <code>.
struct ErrorResponse {
  static HttpResponse Create(http::StatusCode statusCode, std::string_view error, std::string_view message);

  static HttpResponse BadRequest(std::string_view message);

  static HttpResponse Unauthorized(std::string_view message);

  static HttpResponse Forbidden(std::string_view message);

  static HttpResponse NotFound(std::string_view message);

  static HttpResponse MethodNotAllowed(std::string_view message);

  // 422 Validation Error.
  static HttpResponse ValidationError(std::string_view message);

  // 422 Validation Error with an additional "errors" member mapping each invalid field to its messages.
  static HttpResponse ValidationError(std::string_view message, JsonObject errors);

  static HttpResponse TooManyRequests(std::string_view message);

  static HttpResponse ServerError(std::string_view message);

  // Error response for statusCode, with the error label of the helper above handling that code
  // (the reason phrase for other codes).
  static HttpResponse For(http::StatusCode statusCode, std::string_view message);
};

}  // namespace jazzy
