#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "jazzy/http-request.hpp"
#include "jazzy/http-response.hpp"
#include "jazzy/metrics.hpp"
#include "jazzy/request-parse.hpp"
#include "jazzy/router.hpp"
#include "jazzy/socket.hpp"

namespace jazzy {

// Serves exactly one request on an accepted connection, from the request line to the closing of the socket.
// States, in order:
//  1. read the request line (EOF or blank line: close without response)
//  2. parse method and target (400 if malformed)
//  3. check the method (405 with an Allow header if not supported)
//  4. read the headers until a blank line (400 on an invalid Content-Length)
//  5. reject a body on GET and DELETE (400)
//  6. read Content-Length bytes of body, best effort: one read of at most 64 KiB after the buffered bytes
//  7. resolve the route (404)
//  8. invoke the handler (500 if it has none, 400 if POST, PUT or PATCH came without body)
//  9. map what escaped the handler: jazzy::invalid_argument to 400, anything else to 500
// There is no read timeout: a silent client keeps its thread blocked.
class ConnectionHandler {
 public:
  ConnectionHandler(Socket socket, const Router& router, Metrics& metrics) noexcept;

  ConnectionHandler(const ConnectionHandler&) = delete;
  ConnectionHandler(ConnectionHandler&&) = delete;
  ConnectionHandler& operator=(const ConnectionHandler&) = delete;
  ConnectionHandler& operator=(ConnectionHandler&&) = delete;

  ~ConnectionHandler() = default;

  // Processes the request and closes the connection. Never throws.
  void run() noexcept;

 private:
  using Clock = std::chrono::steady_clock;

  void processRequest(Clock::time_point start);

  // Calls the handler of route, turning a jazzy::invalid_argument it raises into a 400.
  static HttpResponse InvokeHandler(const Route& route, const HttpRequest& request);

  // Reads the next line, without its terminating LF or CRLF.
  // Returns false on EOF or read error before any character of the line.
  bool readLine(std::string& line);

  std::string readBody(std::size_t contentLength);

  // Sends the error response of a failed parsing step.
  void sendError(const http::ParseStatus& status);

  // Writes the serialized response. A write failure is logged and counted as a failed request.
  bool send(const HttpResponse& response);

  // Writes the serialized response, logging a failure without counting it.
  bool write(const HttpResponse& response);

  // Last resort 500 after an unexpected fault. Never throws.
  void sendServerError(const char* message) noexcept;

  Socket _socket;
  const Router& _router;
  Metrics& _metrics;
  std::string _buffer;
  std::size_t _bufferPos{};
};

}  // namespace jazzy
