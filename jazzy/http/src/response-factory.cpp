#include "jazzy/response-factory.hpp"

#include <string_view>
#include <utility>

#include "jazzy/http-response.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/json-value.hpp"

namespace jazzy {

HttpResponse ResponseFactory::Success(std::string_view message) {
  return HttpResponse::Json(JsonObject{{"status", "success"}, {"message", message}});
}

HttpResponse ResponseFactory::SuccessWithData(std::string_view message, JsonValue data) {
  return HttpResponse::Json(JsonObject{{"status", "success"}, {"message", message}, {"data", std::move(data)}});
}

HttpResponse ResponseFactory::Error(std::string_view message, http::StatusCode statusCode) {
  return HttpResponse::Json(JsonObject{{"status", "error"}, {"message", message}}).status(statusCode);
}

}  // namespace jazzy
