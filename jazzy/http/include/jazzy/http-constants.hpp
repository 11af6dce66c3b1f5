#pragma once

#include <string_view>

#include "jazzy/http-status-code.hpp"

namespace jazzy::http {

inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view CRLF = "\r\n";

// Header names, in their canonical form for emission. Request header names are stored lower-cased.
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view Allow = "Allow";

// Content types
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

// Reason phrases
inline constexpr std::string_view ReasonOK = "OK";
inline constexpr std::string_view ReasonCreated = "Created";
inline constexpr std::string_view ReasonNoContent = "No Content";
inline constexpr std::string_view ReasonMovedPermanently = "Moved Permanently";
inline constexpr std::string_view ReasonFound = "Found";
inline constexpr std::string_view ReasonBadRequest = "Bad Request";
inline constexpr std::string_view ReasonUnauthorized = "Unauthorized";
inline constexpr std::string_view ReasonForbidden = "Forbidden";
inline constexpr std::string_view ReasonNotFound = "Not Found";
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";
inline constexpr std::string_view ReasonUnknown = "Unknown";

// Reason phrase written in the status line. Codes outside of the table above are written as "Unknown".
constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeCreated:
      return ReasonCreated;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodeMovedPermanently:
      return ReasonMovedPermanently;
    case StatusCodeFound:
      return ReasonFound;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeUnauthorized:
      return ReasonUnauthorized;
    case StatusCodeForbidden:
      return ReasonForbidden;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    default:
      return ReasonUnknown;
  }
}

}  // namespace jazzy::http
