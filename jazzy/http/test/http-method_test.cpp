#include "jazzy/http-method.hpp"

#include <gtest/gtest.h>

#include <array>
#include <string_view>

namespace {

using jazzy::http::Method;
using jazzy::http::MethodExpectsBody;
using jazzy::http::MethodStrToOptEnum;
using jazzy::http::MethodToStr;

struct MethodCase {
  Method method;
  std::string_view token;
};

constexpr std::array<MethodCase, jazzy::http::kNbMethods> kMethodCases = {{{Method::GET, "GET"},
                                                                           {Method::POST, "POST"},
                                                                           {Method::PUT, "PUT"},
                                                                           {Method::DELETE, "DELETE"},
                                                                           {Method::PATCH, "PATCH"}}};

}  // namespace

TEST(HttpMethod, ToStrRoundTrip) {
  for (const auto& methodCase : kMethodCases) {
    EXPECT_EQ(MethodToStr(methodCase.method), methodCase.token);
    EXPECT_EQ(MethodStrToOptEnum(methodCase.token), methodCase.method);
  }
}

TEST(HttpMethod, ParseIsCaseInsensitive) {
  EXPECT_EQ(MethodStrToOptEnum("get"), Method::GET);
  EXPECT_EQ(MethodStrToOptEnum("Patch"), Method::PATCH);
}

TEST(HttpMethod, UnsupportedMethods) {
  EXPECT_FALSE(MethodStrToOptEnum("HEAD"));
  EXPECT_FALSE(MethodStrToOptEnum("OPTIONS"));
  EXPECT_FALSE(MethodStrToOptEnum("GETX"));
  EXPECT_FALSE(MethodStrToOptEnum(""));
}

TEST(HttpMethod, BodyPolicy) {
  EXPECT_TRUE(MethodExpectsBody(Method::POST));
  EXPECT_TRUE(MethodExpectsBody(Method::PUT));
  EXPECT_TRUE(MethodExpectsBody(Method::PATCH));
  EXPECT_FALSE(MethodExpectsBody(Method::GET));
  EXPECT_FALSE(MethodExpectsBody(Method::DELETE));
}

TEST(HttpMethod, AllowedList) { EXPECT_EQ(jazzy::http::kAllowedMethods, "GET, POST, PUT, DELETE, PATCH"); }
