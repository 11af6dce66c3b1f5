#include "jazzy/string-trim.hpp"

#include <gtest/gtest.h>

namespace jazzy {

TEST(StringTrimTest, TrimsSpacesAndTabs) {
  EXPECT_EQ(TrimOws("  hello  "), std::string_view("hello"));
  EXPECT_EQ(TrimOws(" \thello \t"), std::string_view("hello"));
}

TEST(StringTrimTest, OwsPreservesOtherWhitespace) { EXPECT_EQ(TrimOws("\nhello\r"), std::string_view("\nhello\r")); }

TEST(StringTrimTest, TrimBlankRemovesControlChars) {
  EXPECT_EQ(TrimBlank("\r\n hello world \r\n"), std::string_view("hello world"));
  EXPECT_EQ(TrimBlank(""), std::string_view(""));
}

TEST(StringTrimTest, IsBlank) {
  EXPECT_TRUE(IsBlank(""));
  EXPECT_TRUE(IsBlank(" \t\r\n"));
  EXPECT_FALSE(IsBlank(" x "));
}

}  // namespace jazzy
