#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "jazzy/http-method.hpp"
#include "jazzy/http-request.hpp"
#include "jazzy/http-status-code.hpp"

namespace jazzy::http {

// Outcome of one parsing step of an incoming request. A non ok status is answered as is by the connection handler.
struct ParseStatus {
  [[nodiscard]] bool ok() const noexcept { return status == StatusCodeOK; }

  StatusCode status{StatusCodeOK};
  std::string message;
};

struct RequestLine {
  std::string_view method;
  std::string_view path;
  std::string_view query;
};

// Splits "<METHOD> <target> [<version>]" on spaces. The target is split at its first '?' into path and query.
// Fewer than two tokens is a 400.
ParseStatus ParseRequestLine(std::string_view line, RequestLine& requestLine);

// Decodes a "k1=v1&k2=v2" query string into params (form encoding, '+' is a space).
// Pairs without '=' or with an empty key are ignored, a later duplicate key wins.
// Invalid percent encoding is a 400.
ParseStatus ParseQueryString(std::string_view query, StringMap& params);

// Adds "Name: value" to headers, with a lower-cased name and a trimmed value. Lines without ':' are ignored.
void ParseHeaderLine(std::string_view line, StringMap& headers);

// Parses a Content-Length value. A non numeric value is a 400, a negative one counts as 0.
ParseStatus ParseContentLength(std::string_view value, std::size_t& contentLength);

// Only POST, PUT and PATCH requests may carry a body.
ParseStatus CheckBodyAllowed(Method method, std::size_t contentLength);

}  // namespace jazzy::http
