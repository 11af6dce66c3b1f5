#include "jazzy/connection-handler.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "jazzy/error-response.hpp"
#include "jazzy/http-constants.hpp"
#include "jazzy/http-method.hpp"
#include "jazzy/http-request.hpp"
#include "jazzy/http-response.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/invalid-argument-exception.hpp"
#include "jazzy/log.hpp"
#include "jazzy/metrics.hpp"
#include "jazzy/request-parse.hpp"
#include "jazzy/router.hpp"
#include "jazzy/socket.hpp"
#include "jazzy/string-trim.hpp"

namespace jazzy {

namespace {

constexpr std::size_t kReadChunkSize = 4096;

// Upper bound of the single body read, whatever the announced Content-Length.
constexpr std::size_t kMaxBodyReadSize = 64UL * 1024UL;

}  // namespace

ConnectionHandler::ConnectionHandler(Socket socket, const Router& router, Metrics& metrics) noexcept
    : _socket(std::move(socket)), _router(router), _metrics(metrics) {}

void ConnectionHandler::run() noexcept {
  const auto start = Clock::now();
  _metrics.onRequestStart();
  try {
    processRequest(start);
  } catch (const std::exception& ex) {
    _metrics.onRequestFailure();
    log::error("Exception handling request: {}", ex.what());
    sendServerError(ex.what());
  } catch (...) {
    _metrics.onRequestFailure();
    log::error("Unknown exception handling request");
    sendServerError("Unknown error");
  }
  _socket.close();
}

void ConnectionHandler::processRequest(Clock::time_point start) {
  std::string line;
  if (!readLine(line)) {
    log::warn("Client closed connection before sending request line");
    return;
  }
  if (line.empty()) {
    log::debug("Empty request line received, ignoring");
    return;
  }

  http::RequestLine requestLine;
  if (auto status = http::ParseRequestLine(line, requestLine); !status.ok()) {
    log::warn("Malformed request line: {}", line);
    sendError(status);
    return;
  }

  StringMap queryParams;
  if (auto status = http::ParseQueryString(requestLine.query, queryParams); !status.ok()) {
    log::warn("Invalid query string: {}", requestLine.query);
    sendError(status);
    return;
  }

  log::info("Received request: {} {}", requestLine.method, requestLine.path);

  const auto optMethod = http::MethodStrToOptEnum(requestLine.method);
  if (!optMethod) {
    log::warn("Unsupported HTTP method: {}", requestLine.method);
    send(ErrorResponse::MethodNotAllowed(http::ReasonMethodNotAllowed).header(http::Allow, http::kAllowedMethods));
    return;
  }
  const http::Method method = *optMethod;
  const std::string_view methodStr = http::MethodToStr(method);

  StringMap headers;
  std::string headerLine;
  while (readLine(headerLine) && !headerLine.empty()) {
    http::ParseHeaderLine(headerLine, headers);
  }

  std::size_t contentLength = 0;
  if (auto it = headers.find("content-length"); it != headers.end()) {
    if (auto status = http::ParseContentLength(it->second, contentLength); !status.ok()) {
      log::warn("Invalid Content-Length header: {}", it->second);
      sendError(status);
      return;
    }
  }
  if (auto status = http::CheckBodyAllowed(method, contentLength); !status.ok()) {
    log::warn("Request with body on method that should not have one: {}", methodStr);
    sendError(status);
    return;
  }

  std::string body = readBody(contentLength);

  const std::string path(requestLine.path);
  const Route* route = _router.match(method, path);
  if (route == nullptr) {
    log::warn("Route not found: {} {}", methodStr, path);
    send(ErrorResponse::NotFound(fmt::format("Route not found: {} {}", methodStr, path)));
    return;
  }
  log::debug("Found route: {} {} -> {}", methodStr, route->pattern(), route->handlerName());

  StringMap pathParams = Router::ExtractPathParams(route->pattern(), path);

  if (!route->handler()) {
    log::warn("Method not found: {}", route->handlerName());
    send(ErrorResponse::ServerError(fmt::format("Method not found: {}", route->handlerName())));
    return;
  }

  if (http::MethodExpectsBody(method) && IsBlank(body)) {
    log::warn("Empty request body for {} request to {}", methodStr, path);
    send(ErrorResponse::BadRequest(fmt::format("Request body is required for {} requests", methodStr)));
    return;
  }

  HttpRequest request(method, path, std::move(headers), std::move(pathParams), std::move(queryParams),
                      std::move(body));

  if (!send(InvokeHandler(*route, request))) {
    return;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
  _metrics.onRequestSuccess(elapsed);
  log::debug("Response sent in {} ms", elapsed.count());
}

HttpResponse ConnectionHandler::InvokeHandler(const Route& route, const HttpRequest& request) {
  try {
    return route.handler()(request).toResponse();
  } catch (const std::invalid_argument& ex) {
    log::warn("Bad request: {}", ex.what());
    return ErrorResponse::BadRequest(ex.what());
  }
}

bool ConnectionHandler::readLine(std::string& line) {
  line.clear();
  while (true) {
    const auto newLinePos = _buffer.find('\n', _bufferPos);
    if (newLinePos != std::string::npos) {
      std::string_view lineView(_buffer.data() + _bufferPos, newLinePos - _bufferPos);
      if (lineView.ends_with('\r')) {
        lineView.remove_suffix(1);
      }
      line.assign(lineView);
      _bufferPos = newLinePos + 1;
      return true;
    }

    // Keep the partial line only.
    _buffer.erase(0, _bufferPos);
    _bufferPos = 0;

    const auto oldSize = _buffer.size();
    _buffer.resize(oldSize + kReadChunkSize);
    const long nbRead = _socket.readSome(_buffer.data() + oldSize, kReadChunkSize);
    _buffer.resize(oldSize + static_cast<std::size_t>(std::max(nbRead, 0L)));
    if (nbRead <= 0) {
      if (nbRead < 0) {
        log::debug("Read error on fd # {}: {}", _socket.fd(), std::error_code(errno, std::system_category()).message());
      }
      if (_buffer.empty()) {
        return false;
      }
      // Last line of the stream without terminator.
      line.assign(_buffer);
      _buffer.clear();
      return true;
    }
  }
}

std::string ConnectionHandler::readBody(std::size_t contentLength) {
  std::string body;
  if (contentLength == 0) {
    return body;
  }
  const std::size_t nbBuffered = std::min(contentLength, _buffer.size() - _bufferPos);
  body.assign(_buffer, _bufferPos, nbBuffered);
  _bufferPos += nbBuffered;

  if (body.size() < contentLength) {
    // Single read attempt for the remaining bytes, a short read is not retried.
    const auto oldSize = body.size();
    const std::size_t readSize = std::min(contentLength - oldSize, kMaxBodyReadSize);
    body.resize(oldSize + readSize);
    const long nbRead = _socket.readSome(body.data() + oldSize, readSize);
    body.resize(oldSize + static_cast<std::size_t>(std::max(nbRead, 0L)));
  }
  if (body.size() < contentLength) {
    log::debug("Short body read: {} bytes out of {}", body.size(), contentLength);
  }
  return body;
}

void ConnectionHandler::sendError(const http::ParseStatus& status) {
  send(ErrorResponse::For(status.status, status.message));
}

bool ConnectionHandler::send(const HttpResponse& response) {
  if (write(response)) {
    return true;
  }
  _metrics.onRequestFailure();
  return false;
}

bool ConnectionHandler::write(const HttpResponse& response) {
  if (_socket.writeAll(response.serialize())) {
    return true;
  }
  log::error("Unable to write response on fd # {}: {}", _socket.fd(),
             std::error_code(errno, std::system_category()).message());
  return false;
}

void ConnectionHandler::sendServerError(const char* message) noexcept {
  try {
    // The fault is already counted, a write failure here is only logged.
    if (!write(ErrorResponse::ServerError(message))) {
      log::debug("500 response could not be delivered");
    }
  } catch (const std::exception& ex) {
    log::error("Error sending error response: {}", ex.what());
  } catch (...) {
    log::error("Unknown error sending error response");
  }
}

}  // namespace jazzy
