#include <cstdint>
#include <cstdlib>
#include <exception>
#include <utility>

#include "jazzy/http-server.hpp"
#include "jazzy/log.hpp"
#include "jazzy/router.hpp"
#include "jazzy/server-config.hpp"
#include "jazzy/signal-handler.hpp"
#include "jazzy/stringconv.hpp"
#include "product-controller.hpp"
#include "user-controller.hpp"

using namespace jazzy;

int main(int argc, char** argv) {
  uint16_t port = 8088;
  if (argc > 1) {
    const auto optPort = TryStringToIntegral<uint16_t>(argv[1]);
    if (!optPort) {
      log::critical("Invalid port number: {}", argv[1]);
      return EXIT_FAILURE;
    }
    port = *optPort;
  }

  // Enable signal handler for graceful shutdown on Ctrl+C
  SignalHandler::Enable();

  Router router;
  examples::UserController::RegisterRoutes(router);
  examples::ProductController::RegisterRoutes(router);

  try {
    // "/metrics" endpoint is added automatically
    HttpServer server(ServerConfig{}.withPort(port).withMetrics(), std::move(router));
    server.runUntil(SignalHandler::IsStopRequested);
  } catch (const std::exception& ex) {
    log::critical("Server encountered error: {}", ex.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
