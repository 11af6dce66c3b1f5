#include "jazzy/http-server.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include "jazzy/connection-handler.hpp"
#include "jazzy/http-method.hpp"
#include "jazzy/http-request.hpp"
#include "jazzy/http-response.hpp"
#include "jazzy/log.hpp"
#include "jazzy/metrics.hpp"
#include "jazzy/router.hpp"
#include "jazzy/server-config.hpp"
#include "jazzy/socket.hpp"

namespace jazzy {

HttpServer::HttpServer(ServerConfig config, Router router)
    : _config(std::move(config)),
      _state(std::make_shared<SharedState>(std::move(router))),
      _listenSocket(Socket::Type::Stream) {
  _config.validate();
  _listenSocket.bindAndListen(_config.reusePort, _config.listenBacklog, _config.port);
  log::debug("Server bound to port :{}", _config.port);
  if (_config.enableMetrics) {
    registerMetricsRoute();
  }
}

HttpServer::~HttpServer() { stop(); }

void HttpServer::registerMetricsRoute() {
  const Metrics* metrics = &_state->metrics;
  _state->router.addRoute(
      http::Method::GET, "/metrics",
      [metrics](const HttpRequest&) { return HttpResponse::Text(metrics->snapshot().report()); },
      "MetricsController.getMetrics");
  log::info("Metrics route added");
}

void HttpServer::run() {
  runUntil([]() { return false; });
}

void HttpServer::runUntil(const std::function<bool()>& predicate) {
  if (_running.exchange(true)) {
    throw std::logic_error("Server is already running");
  }
  log::info("Server running on port :{}", _config.port);

  try {
    while (!_stopRequested.load(std::memory_order_relaxed) && !predicate()) {
      std::optional<Socket> clientSocket = _listenSocket.acceptFor(_config.pollInterval);
      if (!clientSocket) {
        continue;
      }
      if (_config.tcpNoDelay && !clientSocket->setTcpNoDelay()) {
        log::warn("Unable to set TCP_NODELAY on fd # {}", clientSocket->fd());
      }
      spawnConnection(std::move(*clientSocket));
    }
  } catch (...) {
    _stopRequested.store(false, std::memory_order_relaxed);
    _running.store(false);
    throw;
  }
  // A stop request is consumed by the run it ends.
  _stopRequested.store(false, std::memory_order_relaxed);
  _running.store(false);
  log::info("Server stopped");
}

void HttpServer::spawnConnection(Socket socket) {
  try {
    std::thread([state = _state, socket = std::move(socket)]() mutable {
      ConnectionHandler(std::move(socket), state->router, state->metrics).run();
    }).detach();
  } catch (const std::system_error& ex) {
    log::error("Unable to start connection thread: {}", ex.what());
  }
}

}  // namespace jazzy
