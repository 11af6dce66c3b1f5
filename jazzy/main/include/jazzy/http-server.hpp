#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

#include "jazzy/metrics.hpp"
#include "jazzy/router.hpp"
#include "jazzy/server-config.hpp"
#include "jazzy/socket.hpp"

namespace jazzy {

// Blocking HTTP/1.1 server, one request per connection, one thread per connection.
//  - The listening socket is bound at construction, port() gives the effective port (useful with port 0).
//  - Routes are registered through router() before run() / runUntil(). The route table must not be modified
//    once the server runs: connection threads read it without synchronization.
//  - Each accepted connection is served by a ConnectionHandler on a new detached thread. The number of threads
//    is not bounded.
//  - Connection threads share the route table and the metrics with the server through a shared state that
//    outlives the server if connections are still in flight when it is destroyed.
//
// Typical usage:
//   HttpServer server(ServerConfig{}.withPort(8080));
//   server.router().get("/hello", [](const HttpRequest&) { return "Hello"; });
//   server.runUntil(SignalHandler::IsStopRequested);
class HttpServer {
 public:
  // Validates config, binds and listens. If config.enableMetrics, registers GET /metrics.
  // Throws std::invalid_argument on invalid config, std::system_error if the port cannot be bound.
  explicit HttpServer(ServerConfig config = {}, Router router = {});

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  ~HttpServer();

  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

  [[nodiscard]] Router& router() noexcept { return _state->router; }
  [[nodiscard]] const Router& router() const noexcept { return _state->router; }

  [[nodiscard]] Metrics& metrics() noexcept { return _state->metrics; }
  [[nodiscard]] const Metrics& metrics() const noexcept { return _state->metrics; }

  // Accepts connections until stop() is called.
  // Throws std::logic_error if the server is already running.
  void run();

  // Accepts connections until predicate returns true or stop() is called. predicate is checked at least every
  // config().pollInterval.
  // Throws std::logic_error if the server is already running.
  void runUntil(const std::function<bool()>& predicate);

  // Requests the accept loop to return. Connections in flight are not interrupted. Thread safe.
  // A stop requested before run() makes the next run return immediately.
  void stop() noexcept { _stopRequested.store(true, std::memory_order_relaxed); }

  [[nodiscard]] bool isRunning() const noexcept { return _running.load(std::memory_order_relaxed); }

 private:
  struct SharedState {
    explicit SharedState(Router routerArg) noexcept : router(std::move(routerArg)) {}

    Router router;
    Metrics metrics;
  };

  void registerMetricsRoute();

  // Single place where connection threads are started.
  void spawnConnection(Socket socket);

  ServerConfig _config;
  std::shared_ptr<SharedState> _state;
  Socket _listenSocket;
  std::atomic<bool> _stopRequested{false};
  std::atomic<bool> _running{false};
};

}  // namespace jazzy
