#include "jazzy/url-decode.hpp"

#include <gtest/gtest.h>

#include <string>

namespace jazzy {

TEST(UrlDecodeTest, PlainStringUnchanged) { EXPECT_EQ(url::DecodeFormComponent("hello"), "hello"); }

TEST(UrlDecodeTest, PlusIsSpace) { EXPECT_EQ(url::DecodeFormComponent("John+Doe"), "John Doe"); }

TEST(UrlDecodeTest, PercentSequences) {
  EXPECT_EQ(url::DecodeFormComponent("a%20b"), "a b");
  EXPECT_EQ(url::DecodeFormComponent("%41%62c"), "Abc");
  EXPECT_EQ(url::DecodeFormComponent("x%3Dy%26z"), "x=y&z");
  EXPECT_EQ(url::DecodeFormComponent("caf%C3%A9"), "caf\xC3\xA9");
}

TEST(UrlDecodeTest, InvalidSequences) {
  EXPECT_FALSE(url::DecodeFormComponent("%"));
  EXPECT_FALSE(url::DecodeFormComponent("abc%4"));
  EXPECT_FALSE(url::DecodeFormComponent("%zz"));
}

TEST(UrlDecodeTest, InPlaceCustomPlus) {
  std::string str("a+b%21");
  char* end = url::DecodeInPlace(str.data(), str.data() + str.size(), '+');
  ASSERT_NE(end, nullptr);
  EXPECT_EQ(std::string(str.data(), end), "a+b!");
}

}  // namespace jazzy
