#include "jazzy/request-parse.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "jazzy/http-method.hpp"
#include "jazzy/http-request.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/string-trim.hpp"
#include "jazzy/stringconv.hpp"
#include "jazzy/tolower-str.hpp"
#include "jazzy/url-decode.hpp"

namespace jazzy::http {

namespace {

ParseStatus BadRequest(std::string message) { return ParseStatus{StatusCodeBadRequest, std::move(message)}; }

}  // namespace

ParseStatus ParseRequestLine(std::string_view line, RequestLine& requestLine) {
  // Trailing separators do not make tokens.
  while (line.ends_with(' ')) {
    line.remove_suffix(1);
  }
  const auto firstSpace = line.find(' ');
  if (line.empty() || firstSpace == std::string_view::npos) {
    return BadRequest("Malformed request line");
  }
  requestLine.method = line.substr(0, firstSpace);

  std::string_view target = line.substr(firstSpace + 1);
  target = target.substr(0, target.find(' '));

  const auto questionMarkPos = target.find('?');
  if (questionMarkPos == std::string_view::npos) {
    requestLine.path = target;
    requestLine.query = {};
  } else {
    requestLine.path = target.substr(0, questionMarkPos);
    requestLine.query = target.substr(questionMarkPos + 1);
  }
  return {};
}

ParseStatus ParseQueryString(std::string_view query, StringMap& params) {
  while (!query.empty()) {
    const auto ampPos = query.find('&');
    const std::string_view pair = query.substr(0, ampPos);
    query = ampPos == std::string_view::npos ? std::string_view{} : query.substr(ampPos + 1);

    const auto eqPos = pair.find('=');
    if (eqPos == std::string_view::npos || eqPos == 0) {
      continue;
    }
    auto key = url::DecodeFormComponent(pair.substr(0, eqPos));
    auto value = url::DecodeFormComponent(pair.substr(eqPos + 1));
    if (!key || !value) {
      return BadRequest("Invalid query string");
    }
    params.insert_or_assign(std::move(*key), std::move(*value));
  }
  return {};
}

void ParseHeaderLine(std::string_view line, StringMap& headers) {
  const auto colonPos = line.find(':');
  if (colonPos == std::string_view::npos) {
    return;
  }
  headers.insert_or_assign(ToLower(TrimBlank(line.substr(0, colonPos))),
                           std::string(TrimBlank(line.substr(colonPos + 1))));
}

ParseStatus ParseContentLength(std::string_view value, std::size_t& contentLength) {
  const auto parsed = TryStringToIntegral<int32_t>(TrimBlank(value));
  if (!parsed) {
    return BadRequest("Invalid Content-Length");
  }
  contentLength = *parsed < 0 ? 0 : static_cast<std::size_t>(*parsed);
  return {};
}

ParseStatus CheckBodyAllowed(Method method, std::size_t contentLength) {
  if (contentLength != 0 && !MethodExpectsBody(method)) {
    return BadRequest(std::string("Body not allowed for method ").append(MethodToStr(method)));
  }
  return {};
}

}  // namespace jazzy::http
