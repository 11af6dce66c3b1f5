#pragma once

#include <chrono>
#include <cstdint>

namespace jazzy {

struct ServerConfig {
  // TCP port to bind. 0 lets the OS pick an ephemeral free port. After construction you can retrieve the
  // effective port via HttpServer::port().
  uint16_t port{8080};

  // If true, a GET /metrics route reporting the request counters as plain text is registered automatically.
  bool enableMetrics{true};

  // If true, enables SO_REUSEPORT on the listening socket. Failure to set it is logged, not fatal.
  bool reusePort{false};

  // If true, disables the Nagle algorithm on accepted connections.
  bool tcpNoDelay{false};

  // Maximum duration the accept loop blocks waiting for a new connection before it checks again its stop
  // condition (stop() call or runUntil predicate). Lower values make stopping more responsive.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // Backlog of pending connections given to listen().
  int listenBacklog{128};

  // Throws std::invalid_argument on inconsistent values.
  void validate() const;

  ServerConfig& withPort(uint16_t port);

  ServerConfig& withMetrics(bool on = true);

  ServerConfig& withReusePort(bool on = true);

  ServerConfig& withTcpNoDelay(bool on = true);

  ServerConfig& withPollInterval(std::chrono::milliseconds interval);

  ServerConfig& withListenBacklog(int backlog);
};

}  // namespace jazzy
