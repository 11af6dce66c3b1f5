#include "jazzy/handler-result.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "jazzy/http-constants.hpp"
#include "jazzy/http-response.hpp"
#include "jazzy/http-status-code.hpp"
#include "jazzy/json-value.hpp"
#include "jazzy/validation-result.hpp"

namespace jazzy {

namespace {

struct Product {
  std::string sku;
  double price{};

  template <class F>
  void for_each_field(F&& fun) const {
    fun("sku", sku);
    fun("price", price);
  }
};

HttpResponse ToResponse(HandlerResult result) { return std::move(result).toResponse(); }

}  // namespace

TEST(HandlerResult, ResponseIsKept) {
  auto resp = ToResponse(HttpResponse::Html("<i>x</i>").status(http::StatusCodeCreated));
  EXPECT_EQ(resp.statusCode(), http::StatusCodeCreated);
  EXPECT_EQ(resp.contentType(), http::ContentTypeTextHtml);
}

TEST(HandlerResult, StringBecomesText) {
  auto resp = ToResponse("hello");
  EXPECT_EQ(resp.statusCode(), http::StatusCodeOK);
  EXPECT_EQ(resp.contentType(), http::ContentTypeTextPlain);
  EXPECT_EQ(resp.body(), "hello");
  EXPECT_EQ(ToResponse(std::string("abc")).body(), "abc");
}

TEST(HandlerResult, ValidResultIsSuccessMarker) {
  auto resp = ToResponse(ValidationResult{});
  EXPECT_EQ(resp.statusCode(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), R"({"message":"Validation succeeded"})");
}

TEST(HandlerResult, InvalidResultIsUnprocessable) {
  ValidationResult result;
  result.addError("email", "The email field must be a valid email address");
  result.addError("name", "The name field is required");
  auto resp = ToResponse(result);
  EXPECT_EQ(resp.statusCode(), http::StatusCodeUnprocessableEntity);
  EXPECT_EQ(resp.contentType(), http::ContentTypeApplicationJson);
  EXPECT_EQ(resp.body(),
            R"({"status":422,"error":"Validation Error","message":"Validation failed: )"
            R"({email=The email field must be a valid email address, name=The name field is required}",)"
            R"("errors":{"email":["The email field must be a valid email address"],)"
            R"("name":["The name field is required"]}})");
}

TEST(HandlerResult, OtherValuesBecomeJson) {
  EXPECT_EQ(ToResponse(Product{"AB1234", 9.5}).body(), R"({"sku":"AB1234","price":9.5})");
  EXPECT_EQ(ToResponse(std::vector<int>{1, 2}).body(), "[1,2]");
  EXPECT_EQ(ToResponse(42).body(), "42");
  EXPECT_EQ(ToResponse(JsonObject{{"ok", true}}).body(), R"({"ok":true})");
  auto resp = ToResponse(JsonValue(nullptr));
  EXPECT_EQ(resp.contentType(), http::ContentTypeApplicationJson);
  EXPECT_EQ(resp.body(), "null");
}

}  // namespace jazzy
