#include <gtest/gtest.h>

#include "string_utils.hpp"

TEST(StringUtilsTest, PercentDecode) {
  EXPECT_EQ(utils::percentDecode("a%20b%2Fc"), "a b/c");
  EXPECT_EQ(utils::percentDecode("a+b"), "a+b");
  EXPECT_EQ(utils::percentDecode("a+b", true), "a b");
  EXPECT_EQ(utils::percentDecode("%41"), "A");
  // 非法转义原样保留
  EXPECT_EQ(utils::percentDecode("100%"), "100%");
  EXPECT_EQ(utils::percentDecode("%4"), "%4");
  EXPECT_EQ(utils::percentDecode("%zz"), "%zz");
}

TEST(StringUtilsTest, SplitAnyDropsEmptyPieces) {
  auto pieces = utils::splitAny(",a,,b ,c", ", ");
  ASSERT_EQ(pieces.size(), 3u);
  EXPECT_EQ(pieces[0], "a");
  EXPECT_EQ(pieces[1], "b");
  EXPECT_EQ(pieces[2], "c");
  EXPECT_TRUE(utils::splitAny("", ",").empty());
}

TEST(StringUtilsTest, Trim) {
  EXPECT_EQ(utils::trim("  x y \r\n"), "x y");
  EXPECT_EQ(utils::trim("   "), "");
}

TEST(StringUtilsTest, StartsWithNoCase) {
  EXPECT_TRUE(utils::startsWithNoCase("Content-Length: 5", "content-length:"));
  EXPECT_FALSE(utils::startsWithNoCase("Basic", "Basic "));
}
