#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>
#include <utility>

#include "jazzy/http-server.hpp"
#include "jazzy/router.hpp"
#include "jazzy/server-config.hpp"

namespace jazzy::test {

// Lightweight RAII test server harness:
//  * Construct HttpServer on an ephemeral port (binds & listens immediately, so clients can connect right away)
//  * Start the accept loop in a background jthread using runUntil(stopFlag)
//  * Stop & join automatically on destruction (idempotent)
//
// Routes must be registered through the Router given at construction: the route table cannot change once
// the server runs.
//   Router router;
//   router.get("/hello", [](const HttpRequest&) { return "hi"; });
//   TestServer ts(std::move(router));
//   auto resp = requestParsed(ts.port(), {.target = "/hello"});
struct TestServer {
  explicit TestServer(Router router = {}, ServerConfig cfg = ServerConfig{}.withPort(0),
                      std::chrono::milliseconds pollPeriod = std::chrono::milliseconds{5})
      : server(std::move(cfg.withPollInterval(pollPeriod)), std::move(router)),
        loopThread([this] { server.runUntil([this] { return stopFlag.load(); }); }) {}

  TestServer(const TestServer&) = delete;
  TestServer(TestServer&&) noexcept = delete;
  TestServer& operator=(const TestServer&) = delete;
  TestServer& operator=(TestServer&&) noexcept = delete;

  ~TestServer() { stop(); }

  [[nodiscard]] uint16_t port() const { return server.port(); }

  // Cooperative stop; safe to call multiple times.
  void stop() {
    if (!stopFlag.exchange(true)) {
      server.stop();
    }
    if (loopThread.joinable()) {
      loopThread.join();
    }
  }

  HttpServer server;

 private:
  std::atomic_bool stopFlag{false};
  std::jthread loopThread;  // auto-join on destruction
};

}  // namespace jazzy::test
