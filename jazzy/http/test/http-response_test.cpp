#include "jazzy/http-response.hpp"

#include <gtest/gtest.h>

#include <string>

#include "jazzy/http-constants.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/json-value.hpp"

namespace jazzy {

TEST(HttpResponse, Defaults) {
  HttpResponse resp;
  EXPECT_EQ(resp.statusCode(), http::StatusCodeOK);
  EXPECT_EQ(resp.contentType(), "text/plain");
  EXPECT_TRUE(resp.body().empty());
  EXPECT_TRUE(resp.headers().empty());
}

TEST(HttpResponse, SerializeOrder) {
  auto resp = HttpResponse::Text("hello").status(http::StatusCodeCreated).header("X-Custom", "1");
  EXPECT_EQ(resp.serialize(),
            "HTTP/1.1 201 Created\r\n"
            "Content-Type: text/plain\r\n"
            "Content-Length: 5\r\n"
            "X-Custom: 1\r\n"
            "\r\n"
            "hello");
}

TEST(HttpResponse, ContentLengthCountsBytes) {
  auto resp = HttpResponse::Text("h\xC3\xA9llo");
  EXPECT_NE(resp.serialize().find("Content-Length: 6\r\n"), std::string::npos);
}

TEST(HttpResponse, UnknownReasonPhrase) {
  HttpResponse resp(418);
  EXPECT_TRUE(resp.serialize().starts_with("HTTP/1.1 418 Unknown\r\n"));
  EXPECT_TRUE(HttpResponse(http::StatusCodeUnprocessableEntity).serialize().starts_with("HTTP/1.1 422 Unknown\r\n"));
}

TEST(HttpResponse, Json) {
  auto resp = HttpResponse::Json(JsonObject{{"id", "42"}, {"name", "John"}});
  EXPECT_EQ(resp.contentType(), http::ContentTypeApplicationJson);
  EXPECT_EQ(resp.body(), R"({"id":"42","name":"John"})");
}

TEST(HttpResponse, Html) {
  auto resp = HttpResponse::Html("<p>hi</p>");
  EXPECT_EQ(resp.contentType(), "text/html");
  EXPECT_EQ(resp.body(), "<p>hi</p>");
}

TEST(HttpResponse, Redirect) {
  auto resp = HttpResponse::Redirect("/login");
  EXPECT_EQ(resp.statusCode(), http::StatusCodeFound);
  EXPECT_EQ(resp.headerValue("location"), "/login");
  EXPECT_TRUE(resp.body().empty());
  EXPECT_TRUE(resp.serialize().starts_with("HTTP/1.1 302 Found\r\n"));
}

TEST(HttpResponse, HeaderReplacedCaseInsensitively) {
  HttpResponse resp;
  resp.header("X-Trace", "a").header("x-trace", "b").header("Other", "c");
  ASSERT_EQ(resp.headers().size(), 2U);
  EXPECT_EQ(resp.headers()[0].first, "X-Trace");
  EXPECT_EQ(resp.headers()[0].second, "b");
  EXPECT_FALSE(resp.headerValue("Missing"));
}

TEST(HttpResponse, ChainedSettersOnLvalue) {
  HttpResponse resp;
  resp.status(http::StatusCodeNotFound).contentType("application/xml").body("<a/>");
  EXPECT_EQ(resp.statusCode(), http::StatusCodeNotFound);
  EXPECT_EQ(resp.contentType(), "application/xml");
  EXPECT_EQ(resp.body(), "<a/>");
}

}  // namespace jazzy
