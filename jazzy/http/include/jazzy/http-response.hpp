#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jazzy/http-constants.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/json-value.hpp"

namespace jazzy {

// Fully buffered HTTP response, built by chained calls:
//   HttpResponse::Json(obj).status(http::StatusCodeCreated).header("X-Request-Id", id)
// Defaults to 200 with an empty text/plain body.
class HttpResponse {
 public:
  using HeaderList = std::vector<std::pair<std::string, std::string>>;

  HttpResponse() = default;

  explicit HttpResponse(http::StatusCode statusCode) noexcept : _statusCode(statusCode) {}

  // application/json response holding the compact serialization of value.
  static HttpResponse Json(const JsonValue& value);

  // application/json response with an already serialized JSON document as body.
  static HttpResponse JsonBody(std::string jsonText);

  static HttpResponse Text(std::string body);

  static HttpResponse Html(std::string body);

  // 302 Found with a Location header, empty body.
  static HttpResponse Redirect(std::string_view url);

  [[nodiscard]] http::StatusCode statusCode() const noexcept { return _statusCode; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] std::string_view contentType() const noexcept { return _contentType; }

  // Custom headers in insertion order (Content-Type and Content-Length excluded).
  [[nodiscard]] const HeaderList& headers() const noexcept { return _headers; }

  // Value of custom header key (case insensitive), std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  HttpResponse& status(http::StatusCode statusCode) & noexcept {
    _statusCode = statusCode;
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && noexcept {
    _statusCode = statusCode;
    return std::move(*this);
  }

  // Sets custom header key to value, replacing a previous value of the same header.
  HttpResponse& header(std::string_view key, std::string_view value) & {
    setHeader(key, value);
    return *this;
  }

  HttpResponse&& header(std::string_view key, std::string_view value) && {
    setHeader(key, value);
    return std::move(*this);
  }

  HttpResponse& contentType(std::string_view contentType) & {
    _contentType = contentType;
    return *this;
  }

  HttpResponse&& contentType(std::string_view contentType) && {
    _contentType = contentType;
    return std::move(*this);
  }

  HttpResponse& body(std::string body) & noexcept {
    _body = std::move(body);
    return *this;
  }

  HttpResponse&& body(std::string body) && noexcept {
    _body = std::move(body);
    return std::move(*this);
  }

  // Wire format: status line, Content-Type, Content-Length (bytes of the body), custom headers, blank line, body.
  [[nodiscard]] std::string serialize() const;

  bool operator==(const HttpResponse&) const = default;

 private:
  void setHeader(std::string_view key, std::string_view value);

  http::StatusCode _statusCode{http::StatusCodeOK};
  std::string _contentType{http::ContentTypeTextPlain};
  std::string _body;
  HeaderList _headers;
};

}  // namespace jazzy
