#include "jazzy/response-factory.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "jazzy/http-constants.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/invalid-argument-exception.hpp"

namespace jazzy {

namespace {

struct User {
  std::string id;
  std::string name;

  template <class F>
  void for_each_field(F&& fun) const {
    fun("id", id);
    fun("name", name);
  }
};

}  // namespace

TEST(ResponseFactory, JsonFromStruct) {
  auto resp = ResponseFactory::Json(User{"42", "John"});
  EXPECT_EQ(resp.statusCode(), http::StatusCodeOK);
  EXPECT_EQ(resp.contentType(), http::ContentTypeApplicationJson);
  EXPECT_EQ(resp.body(), R"({"id":"42","name":"John"})");
}

TEST(ResponseFactory, JsonFromContainers) {
  EXPECT_EQ(ResponseFactory::Json(std::vector<int>{1, 2, 3}).body(), "[1,2,3]");
  EXPECT_EQ(ResponseFactory::Json(std::map<std::string, int>{{"a", 1}, {"b", 2}}).body(), R"({"a":1,"b":2})");
}

TEST(ResponseFactory, JsonFromKeyValues) {
  auto resp = ResponseFactory::Json("id", 42, "name", "John", "admin", false);
  EXPECT_EQ(resp.body(), R"({"id":42,"name":"John","admin":false})");
}

TEST(ResponseFactory, JsonRejectsOddArgumentCount) {
  EXPECT_THROW((void)ResponseFactory::Json("name", "X", "age"), invalid_argument);
}

TEST(ResponseFactory, JsonRejectsNonStringKeys) {
  EXPECT_THROW((void)ResponseFactory::Json(123, "X"), invalid_argument);
}

TEST(ResponseFactory, Success) {
  EXPECT_EQ(ResponseFactory::Success("Saved").body(), R"({"status":"success","message":"Saved"})");
  auto resp = ResponseFactory::Success("Created", User{"1", "Ann"});
  EXPECT_EQ(resp.body(), R"({"status":"success","message":"Created","data":{"id":"1","name":"Ann"}})");
}

TEST(ResponseFactory, Error) {
  auto resp = ResponseFactory::Error("Bad input");
  EXPECT_EQ(resp.statusCode(), http::StatusCodeBadRequest);
  EXPECT_EQ(resp.body(), R"({"status":"error","message":"Bad input"})");
  EXPECT_EQ(ResponseFactory::Error("Nope", http::StatusCodeForbidden).statusCode(), http::StatusCodeForbidden);
}

TEST(ResponseFactory, TextHtmlRedirect) {
  EXPECT_EQ(ResponseFactory::Text("hi").contentType(), http::ContentTypeTextPlain);
  EXPECT_EQ(ResponseFactory::Html("<b>hi</b>").contentType(), http::ContentTypeTextHtml);
  auto redirect = ResponseFactory::Redirect("https://example.com");
  EXPECT_EQ(redirect.statusCode(), http::StatusCodeFound);
  EXPECT_EQ(redirect.headerValue(http::Location), "https://example.com");
}

}  // namespace jazzy
