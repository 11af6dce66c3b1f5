#include <gtest/gtest.h>
#include <sys/resource.h>
#include <sys/socket.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#include "jazzy/handler-result.hpp"
#include "jazzy/http-method.hpp"
#include "jazzy/http-request.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/invalid-argument-exception.hpp"
#include "jazzy/router.hpp"
#include "jazzy/test_server_fixture.hpp"
#include "jazzy/test_util.hpp"

namespace jazzy {

namespace {

struct Order {
  std::string item;
  int quantity{};

  template <class F>
  void for_each_field(F&& fun) {
    fun("item", item);
    fun("quantity", quantity);
  }
};

Router MakeRouter() {
  Router router;
  router.get("/ok", [](const HttpRequest&) { return "ok"; });
  router.post("/ok", [](const HttpRequest& req) { return std::string(req.body()); });
  router.get("/bad-argument", [](const HttpRequest&) -> HandlerResult {
    throw invalid_argument("Parameter 'id' is required");
  });
  router.get("/std-bad-argument", [](const HttpRequest&) -> HandlerResult { throw std::invalid_argument("bad"); });
  router.get("/fault", [](const HttpRequest&) -> HandlerResult { throw std::runtime_error("database is down"); });
  router.get("/unknown-fault", [](const HttpRequest&) -> HandlerResult { throw 42; });
  router.get("/slow-fault", [](const HttpRequest&) -> HandlerResult {
    std::this_thread::sleep_for(std::chrono::milliseconds{200});
    throw std::runtime_error("timeout from upstream");
  });
  router.addRoute(http::Method::GET, "/no-handler", RequestHandler{}, "OrderController.missing");
  router.post("/orders", [](const HttpRequest& req) {
    auto order = req.toObject<Order>();
    return order.item + " x" + std::to_string(order.quantity);
  });
  router.post("/json", [](const HttpRequest& req) { return req.parseJson(); });
  return router;
}

void ExpectError(const test::ParsedResponse& resp, http::StatusCode status, std::string_view error,
                 std::string_view message) {
  EXPECT_EQ(resp.statusCode, status);
  EXPECT_EQ(resp.headers.at("Content-Type"), "application/json");
  EXPECT_EQ(resp.body, "{\"status\":" + std::to_string(status) + ",\"error\":\"" + std::string(error) +
                           "\",\"message\":\"" + std::string(message) + "\"}");
}

// Peak resident set size of the process, in KiB.
int64_t MaxRssKb() {
  rusage usage{};
  if (::getrusage(RUSAGE_SELF, &usage) != 0) {
    return 0;
  }
  return usage.ru_maxrss;
}

}  // namespace

class HttpErrorsTest : public ::testing::Test {
 protected:
  test::TestServer ts{MakeRouter()};
};

TEST_F(HttpErrorsTest, MalformedRequestLine) {
  auto resp = test::parseResponseOrThrow(test::sendAndCollect(ts.port(), "GARBAGE\r\n\r\n"));
  ExpectError(resp, http::StatusCodeBadRequest, "Bad Request", "Malformed request line");
}

TEST_F(HttpErrorsTest, UnsupportedMethod) {
  auto resp = test::requestParsed(ts.port(), {.method = "OPTIONS", .target = "/ok"});
  ExpectError(resp, http::StatusCodeMethodNotAllowed, "Method Not Allowed", "Method Not Allowed");
  EXPECT_EQ(resp.headers["Allow"], "GET, POST, PUT, DELETE, PATCH");
}

TEST_F(HttpErrorsTest, InvalidContentLength) {
  auto resp = test::parseResponseOrThrow(
      test::sendAndCollect(ts.port(), "POST /ok HTTP/1.1\r\nContent-Length: ten\r\n\r\nhello"));
  ExpectError(resp, http::StatusCodeBadRequest, "Bad Request", "Invalid Content-Length");
}

TEST_F(HttpErrorsTest, BodyNotAllowedOnGet) {
  auto resp = test::requestParsed(ts.port(), {.method = "GET", .target = "/ok", .body = "data"});
  ExpectError(resp, http::StatusCodeBadRequest, "Bad Request", "Body not allowed for method GET");
}

TEST_F(HttpErrorsTest, BodyRequiredOnPost) {
  auto resp = test::requestParsed(ts.port(), {.method = "POST", .target = "/ok"});
  ExpectError(resp, http::StatusCodeBadRequest, "Bad Request", "Request body is required for POST requests");

  resp = test::requestParsed(ts.port(), {.method = "POST", .target = "/ok", .body = "   "});
  EXPECT_EQ(resp.statusCode, http::StatusCodeBadRequest);
}

TEST_F(HttpErrorsTest, BodyRequiredIsCheckedAfterRouting) {
  auto resp = test::requestParsed(ts.port(), {.method = "POST", .target = "/missing"});
  EXPECT_EQ(resp.statusCode, http::StatusCodeNotFound);
}

TEST_F(HttpErrorsTest, InvalidQueryString) {
  auto resp = test::requestParsed(ts.port(), {.target = "/ok?x=%G1"});
  ExpectError(resp, http::StatusCodeBadRequest, "Bad Request", "Invalid query string");
}

TEST_F(HttpErrorsTest, InvalidArgumentFromHandlerIsBadRequest) {
  auto resp = test::requestParsed(ts.port(), {.target = "/bad-argument"});
  ExpectError(resp, http::StatusCodeBadRequest, "Bad Request", "Parameter 'id' is required");
  EXPECT_EQ(test::requestParsed(ts.port(), {.target = "/std-bad-argument"}).statusCode, http::StatusCodeBadRequest);
  EXPECT_EQ(ts.server.metrics().snapshot().failedRequests, 0U);
}

TEST_F(HttpErrorsTest, FaultFromHandlerIsServerError) {
  auto resp = test::requestParsed(ts.port(), {.target = "/fault"});
  ExpectError(resp, http::StatusCodeInternalServerError, "Internal Server Error", "database is down");
  EXPECT_EQ(ts.server.metrics().snapshot().failedRequests, 1U);
}

TEST_F(HttpErrorsTest, UnknownFaultFromHandler) {
  auto resp = test::requestParsed(ts.port(), {.target = "/unknown-fault"});
  ExpectError(resp, http::StatusCodeInternalServerError, "Internal Server Error", "Unknown error");
}

TEST_F(HttpErrorsTest, MissingHandler) {
  auto resp = test::requestParsed(ts.port(), {.target = "/no-handler"});
  ExpectError(resp, http::StatusCodeInternalServerError, "Internal Server Error",
              "Method not found: OrderController.missing");
}

TEST_F(HttpErrorsTest, MalformedJsonBody) {
  auto resp = test::requestParsed(ts.port(), {.method = "POST", .target = "/orders", .body = R"({"item": )"});
  EXPECT_EQ(resp.statusCode, http::StatusCodeBadRequest);
  EXPECT_TRUE(resp.body.contains("Invalid JSON body")) << resp.body;

  resp = test::requestParsed(ts.port(), {.method = "POST", .target = "/json", .body = "[1]"});
  EXPECT_EQ(resp.statusCode, http::StatusCodeBadRequest);
}

TEST_F(HttpErrorsTest, ToObject) {
  auto resp = test::requestParsed(ts.port(),
                                  {.method = "POST", .target = "/orders", .body = R"({"item":"pen","quantity":3})"});
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "pen x3");
}

TEST_F(HttpErrorsTest, ClientClosingWithoutRequestGetsNoResponse) {
  test::ClientConnection cnx(ts.port());
  cnx.shutdownWrite();
  test::setRecvTimeout(cnx.fd(), std::chrono::seconds{2});
  EXPECT_TRUE(test::recvUntilClosed(cnx.fd()).empty());
}

TEST_F(HttpErrorsTest, EmptyRequestLineGetsNoResponse) {
  EXPECT_TRUE(test::sendAndCollect(ts.port(), "\r\n").empty());
}

TEST_F(HttpErrorsTest, ShortBodyIsNotWaitedFor) {
  // Announced length larger than what is sent: the body is what could be read, the handler still runs.
  test::ClientConnection cnx(ts.port());
  test::setRecvTimeout(cnx.fd(), std::chrono::seconds{2});
  ASSERT_TRUE(test::sendAll(cnx.fd(), "POST /ok HTTP/1.1\r\nContent-Length: 20\r\n\r\nabc"));
  cnx.shutdownWrite();
  auto resp = test::parseResponseOrThrow(test::recvUntilClosed(cnx.fd()));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "abc");
}

TEST_F(HttpErrorsTest, HugeContentLengthIsNotPreallocated) {
  const int64_t rssBefore = MaxRssKb();
  test::ClientConnection cnx(ts.port());
  test::setRecvTimeout(cnx.fd(), std::chrono::seconds{2});
  ASSERT_TRUE(test::sendAll(cnx.fd(), "POST /ok HTTP/1.1\r\nContent-Length: 2000000000\r\n\r\nabc"));
  cnx.shutdownWrite();
  auto resp = test::parseResponseOrThrow(test::recvUntilClosed(cnx.fd()));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "abc");
  EXPECT_LT(MaxRssKb() - rssBefore, 64 * 1024);
}

TEST_F(HttpErrorsTest, FaultWithUndeliveredResponseCountsOneFailure) {
  {
    test::ClientConnection cnx(ts.port());
    ASSERT_TRUE(test::sendAll(cnx.fd(), "GET /slow-fault HTTP/1.1\r\n\r\n"));
    // Reset the connection on close so that writing the 500 fails.
    linger lin{1, 0};
    ASSERT_EQ(::setsockopt(cnx.fd(), SOL_SOCKET, SO_LINGER, &lin, sizeof(lin)), 0);
  }
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{2};
  while (ts.server.metrics().snapshot().failedRequests == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }
  std::this_thread::sleep_for(std::chrono::milliseconds{100});
  const auto snapshot = ts.server.metrics().snapshot();
  EXPECT_EQ(snapshot.totalRequests, 1U);
  EXPECT_EQ(snapshot.failedRequests, 1U);
  EXPECT_EQ(snapshot.successfulRequests, 0U);
}

}  // namespace jazzy
