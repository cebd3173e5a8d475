/* -*- mode: c++; c-basic-offset: 2; indent-tabs-mode: nil; -*-
 * (c) 2015 Henner Zeller <h.zeller@acm.org>
 * (c) 2026 The FixG Authors
 *
 * This file is part of FixG.
 *
 * FixG is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * FixG is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with FixG.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "common/string-util.h"

#include <gtest/gtest.h>

#include <cstdint>

TEST(StringUtilTest, TrimWhitespace) {
  EXPECT_EQ("hello", TrimWhitespace(" \t  hello \n\r  "));
  EXPECT_EQ("hello world", TrimWhitespace("hello world"));
  EXPECT_TRUE(TrimWhitespace(" \t ").empty());
  EXPECT_TRUE(TrimWhitespace("").empty());
}

TEST(StringUtilTest, ASCIIToLower) {
  EXPECT_EQ("hello world", ToLower("Hello WORLD"));
  EXPECT_EQ("shift-add", ToLower("Shift-Add"));
}

TEST(StringUtilTest, StringPrintf) {
  EXPECT_EQ("", StringPrintf("%s", ""));
  EXPECT_EQ("bits=32 mode=multiply",
            StringPrintf("bits=%d mode=%s", 32, "multiply"));
  // Longer than any fixed buffer one might guess.
  const std::string long_string(1000, 'x');
  EXPECT_EQ(long_string + "!", StringPrintf("%s!", long_string.c_str()));
}

TEST(StringUtilTest, ParseDecimalInt) {
  int32_t value;
  EXPECT_FALSE(convert_strto32("hello", &value));
  EXPECT_TRUE(convert_strto32("123", &value));
  EXPECT_EQ(123, value);
  EXPECT_TRUE(convert_strto32("+456", &value));
  EXPECT_EQ(456, value);
  EXPECT_TRUE(convert_strto32("-789", &value));
  EXPECT_EQ(-789, value);
  EXPECT_TRUE(convert_strto32(" 123 ", &value));
  EXPECT_EQ(123, value);
  EXPECT_FALSE(convert_strto32("2147483648", &value));  // too large

  // Make sure we're not assumming a nul-byte at a particular point
  const std::string_view longer_string("4255");
  EXPECT_TRUE(convert_strto32(longer_string.substr(0, 2), &value));
  EXPECT_EQ(42, value);

  // Make sure the returned value points to the characters after the number.
  const std::string_view input = " +314cm";
  const std::string_view expected_remain = input.substr(input.find("cm"));
  const char *remain_string = convert_strto32(input, &value);
  ASSERT_TRUE(remain_string);
  EXPECT_EQ(314, value);
  EXPECT_EQ(remain_string, expected_remain.data());  // pointers must match.
}

TEST(StringUtilTest, ParseFullInt) {
  int32_t value = 0;
  EXPECT_TRUE(ParseFullInt32(" 64 ", &value));
  EXPECT_EQ(64, value);
  EXPECT_TRUE(ParseFullInt32("-16", &value));
  EXPECT_EQ(-16, value);
  EXPECT_FALSE(ParseFullInt32("32bit", &value));
  EXPECT_FALSE(ParseFullInt32("", &value));
  EXPECT_FALSE(ParseFullInt32("  ", &value));
}

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
