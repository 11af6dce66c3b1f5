#include "jazzy/http-response.hpp"

#include <fmt/format.h>

#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "jazzy/http-constants.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/json-encode.hpp"
#include "jazzy/json-value.hpp"
#include "jazzy/string-equal-ignore-case.hpp"

namespace jazzy {

HttpResponse HttpResponse::Json(const JsonValue& value) { return JsonBody(ToJson(value)); }

HttpResponse HttpResponse::JsonBody(std::string jsonText) {
  HttpResponse resp;
  resp._contentType = http::ContentTypeApplicationJson;
  resp._body = std::move(jsonText);
  return resp;
}

HttpResponse HttpResponse::Text(std::string body) {
  HttpResponse resp;
  resp._body = std::move(body);
  return resp;
}

HttpResponse HttpResponse::Html(std::string body) {
  HttpResponse resp;
  resp._contentType = http::ContentTypeTextHtml;
  resp._body = std::move(body);
  return resp;
}

HttpResponse HttpResponse::Redirect(std::string_view url) {
  HttpResponse resp(http::StatusCodeFound);
  resp.setHeader(http::Location, url);
  return resp;
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view key) const noexcept {
  for (const auto& [name, value] : _headers) {
    if (CaseInsensitiveEqual(name, key)) {
      return value;
    }
  }
  return std::nullopt;
}

void HttpResponse::setHeader(std::string_view key, std::string_view value) {
  for (auto& [name, existingValue] : _headers) {
    if (CaseInsensitiveEqual(name, key)) {
      existingValue = value;
      return;
    }
  }
  _headers.emplace_back(key, value);
}

std::string HttpResponse::serialize() const {
  std::string out;
  out.reserve(64UL + _contentType.size() + _body.size());
  auto outIt = std::back_inserter(out);
  fmt::format_to(outIt, "{} {} {}{}", http::HTTP11Sv, _statusCode, http::ReasonPhraseFor(_statusCode), http::CRLF);
  fmt::format_to(outIt, "{}: {}{}", http::ContentType, _contentType, http::CRLF);
  fmt::format_to(outIt, "{}: {}{}", http::ContentLength, _body.size(), http::CRLF);
  for (const auto& [name, value] : _headers) {
    fmt::format_to(outIt, "{}: {}{}", name, value, http::CRLF);
  }
  out.append(http::CRLF);
  out.append(_body);
  return out;
}

}  // namespace jazzy
