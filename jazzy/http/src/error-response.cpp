#include "jazzy/error-response.hpp"

#include <string_view>
#include <utility>

#include "jazzy/http-constants.hpp"
#include "jazzy/http-response.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/json-value.hpp"

namespace jazzy {

HttpResponse ErrorResponse::Create(http::StatusCode statusCode, std::string_view error, std::string_view message) {
  JsonObject body{{"status", statusCode}, {"error", error}, {"message", message}};
  return HttpResponse::Json(body).status(statusCode);
}

HttpResponse ErrorResponse::BadRequest(std::string_view message) {
  return Create(http::StatusCodeBadRequest, http::ReasonBadRequest, message);
}

HttpResponse ErrorResponse::Unauthorized(std::string_view message) {
  return Create(http::StatusCodeUnauthorized, http::ReasonUnauthorized, message);
}

HttpResponse ErrorResponse::Forbidden(std::string_view message) {
  return Create(http::StatusCodeForbidden, http::ReasonForbidden, message);
}

HttpResponse ErrorResponse::NotFound(std::string_view message) {
  return Create(http::StatusCodeNotFound, http::ReasonNotFound, message);
}

HttpResponse ErrorResponse::MethodNotAllowed(std::string_view message) {
  return Create(http::StatusCodeMethodNotAllowed, http::ReasonMethodNotAllowed, message);
}

HttpResponse ErrorResponse::ValidationError(std::string_view message) {
  return Create(http::StatusCodeUnprocessableEntity, "Validation Error", message);
}

HttpResponse ErrorResponse::ValidationError(std::string_view message, JsonObject errors) {
  JsonObject body{{"status", http::StatusCodeUnprocessableEntity}, {"error", "Validation Error"}, {"message", message}};
  body.add("errors", std::move(errors));
  return HttpResponse::Json(body).status(http::StatusCodeUnprocessableEntity);
}

HttpResponse ErrorResponse::TooManyRequests(std::string_view message) {
  return Create(http::StatusCodeTooManyRequests, "Too Many Requests", message);
}

HttpResponse ErrorResponse::ServerError(std::string_view message) {
  return Create(http::StatusCodeInternalServerError, http::ReasonInternalServerError, message);
}

HttpResponse ErrorResponse::For(http::StatusCode statusCode, std::string_view message) {
  switch (statusCode) {
    case http::StatusCodeUnprocessableEntity:
      return ValidationError(message);
    case http::StatusCodeTooManyRequests:
      return TooManyRequests(message);
    default:
      return Create(statusCode, http::ReasonPhraseFor(statusCode), message);
  }
}

}  // namespace jazzy
