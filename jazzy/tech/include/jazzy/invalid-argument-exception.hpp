#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace jazzy {

// Caller input condition. When it escapes a request handler it is reported to the client as a 400 Bad Request
// carrying what() as message.
class invalid_argument : public std::invalid_argument {
 public:
  explicit invalid_argument(const char* msg) : std::invalid_argument(msg) {}

  explicit invalid_argument(const std::string& msg) : std::invalid_argument(msg) {}

  template <typename... Args>
  explicit invalid_argument(fmt::format_string<Args...> fmt, Args&&... args)
      : std::invalid_argument(fmt::format(fmt, std::forward<Args>(args)...)) {}
};

// Request body that is not valid JSON, or that cannot be decoded into the requested shape.
class malformed_body : public invalid_argument {
 public:
  using invalid_argument::invalid_argument;
};

}  // namespace jazzy
