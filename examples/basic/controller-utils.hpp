#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "jazzy/http-response.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/response-factory.hpp"
#include "jazzy/validation-result.hpp"

namespace jazzy::examples {

// {"status": "error", "message": "Validation failed", "errors": {field: [messages]}} with a 400 status.
inline HttpResponse ValidationFailed(const ValidationResult& result) {
  return ResponseFactory::Json("status", "error", "message", "Validation failed", "errors", result.errorsJson())
      .status(http::StatusCodeBadRequest);
}

// Stand-in for an id generated by a database.
inline std::string NewId(std::string_view prefix) {
  const auto nowMs =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch());
  return std::string(prefix).append(std::to_string(nowMs.count()));
}

}  // namespace jazzy::examples
