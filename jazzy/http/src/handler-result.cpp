#include "jazzy/handler-result.hpp"

#include <string>
#include <utility>
#include <variant>

#include "jazzy/error-response.hpp"
#include "jazzy/http-response.hpp"
#include "jazzy/json-value.hpp"
#include "jazzy/validation-result.hpp"

namespace jazzy {

namespace {

struct ResultToResponse {
  HttpResponse operator()(HttpResponse& response) const { return std::move(response); }

  HttpResponse operator()(std::string& text) const { return HttpResponse::Text(std::move(text)); }

  HttpResponse operator()(const ValidationResult& result) const {
    if (result.isValid()) {
      return HttpResponse::Json(JsonObject{{"message", "Validation succeeded"}});
    }
    return ErrorResponse::ValidationError("Validation failed: " + result.firstErrorsString(), result.errorsJson());
  }

  HttpResponse operator()(const JsonValue& value) const { return HttpResponse::Json(value); }
};

}  // namespace

HttpResponse HandlerResult::toResponse() && { return std::visit(ResultToResponse{}, _value); }

}  // namespace jazzy
