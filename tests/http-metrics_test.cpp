#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "jazzy/handler-result.hpp"
#include "jazzy/http-request.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/metrics.hpp"
#include "jazzy/router.hpp"
#include "jazzy/server-config.hpp"
#include "jazzy/test_server_fixture.hpp"
#include "jazzy/test_util.hpp"

using namespace std::chrono_literals;

namespace jazzy {

namespace {

Router MakeRouter() {
  Router router;
  router.get("/hello", [](const HttpRequest&) { return "hello"; });
  router.get("/slow", [](const HttpRequest&) {
    std::this_thread::sleep_for(30ms);
    return "slow";
  });
  router.get("/fault", [](const HttpRequest&) -> HandlerResult { throw std::runtime_error("boom"); });
  return router;
}

}  // namespace

TEST(HttpMetrics, ReportWithoutRequestsExceptItself) {
  test::TestServer ts(MakeRouter());
  auto resp = test::requestParsed(ts.port(), {.target = "/metrics"});
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.headers["Content-Type"], "text/plain");
  // The metrics request itself is counted as started, not yet completed.
  EXPECT_EQ(resp.body, "Total Requests: 1\nTotal Failed Requests: 0\nAverage Response Time (ms): 0\n");
}

TEST(HttpMetrics, CountsRequests) {
  test::TestServer ts(MakeRouter());
  for (int requestPos = 0; requestPos < 3; ++requestPos) {
    EXPECT_EQ(test::requestParsed(ts.port(), {.target = "/hello"}).statusCode, http::StatusCodeOK);
  }
  EXPECT_EQ(test::requestParsed(ts.port(), {.target = "/fault"}).statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(test::requestParsed(ts.port(), {.target = "/missing"}).statusCode, http::StatusCodeNotFound);

  MetricsSnapshot snapshot = ts.server.metrics().snapshot();
  EXPECT_EQ(snapshot.totalRequests, 5U);
  EXPECT_EQ(snapshot.successfulRequests, 3U);
  EXPECT_EQ(snapshot.failedRequests, 1U);

  auto body = test::requestParsed(ts.port(), {.target = "/metrics"}).body;
  EXPECT_TRUE(body.starts_with("Total Requests: 6\nTotal Failed Requests: 1\n")) << body;
}

TEST(HttpMetrics, AverageResponseTime) {
  test::TestServer ts(MakeRouter());
  EXPECT_EQ(test::requestParsed(ts.port(), {.target = "/slow"}).body, "slow");
  EXPECT_EQ(test::requestParsed(ts.port(), {.target = "/slow"}).body, "slow");

  MetricsSnapshot snapshot = ts.server.metrics().snapshot();
  EXPECT_EQ(snapshot.successfulRequests, 2U);
  EXPECT_GE(snapshot.totalResponseTimeMs, 60U);
  EXPECT_EQ(snapshot.averageResponseTimeMs(), snapshot.totalResponseTimeMs / 2);

  auto body = test::requestParsed(ts.port(), {.target = "/metrics"}).body;
  const auto expectedAverage = ts.server.metrics().snapshot().totalResponseTimeMs / 3;
  EXPECT_TRUE(body.ends_with("Average Response Time (ms): " + std::to_string(expectedAverage) + "\n")) << body;
}

TEST(HttpMetrics, ConcurrentConnections) {
  test::TestServer ts(MakeRouter());
  static constexpr int kNbClients = 8;
  std::vector<std::jthread> clients;
  for (int clientPos = 0; clientPos < kNbClients; ++clientPos) {
    clients.emplace_back([&ts] { EXPECT_EQ(test::requestParsed(ts.port(), {.target = "/slow"}).body, "slow"); });
  }
  clients.clear();
  EXPECT_EQ(ts.server.metrics().snapshot().successfulRequests, static_cast<uint64_t>(kNbClients));
}

TEST(HttpMetrics, EndpointCanBeDisabled) {
  test::TestServer ts(MakeRouter(), ServerConfig{}.withPort(0).withMetrics(false));
  EXPECT_EQ(test::requestParsed(ts.port(), {.target = "/metrics"}).statusCode, http::StatusCodeNotFound);
}

}  // namespace jazzy
