/* -*- mode: c++; c-basic-offset: 2; indent-tabs-mode: nil; -*-
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

#include "gcode-parser/decimal.h"

#include <gtest/gtest.h>

#include <limits>
#include <string>

namespace fixg {

// Puts a parser in the middle of a fraction, with counters that would
// otherwise need billions of characters to get there.
class DecimalParserTestPeer {
public:
  template <typename Parser>
  static void SetFraction(Parser *parser, uint32_t negative_exponent,
                          uint32_t trailing_zeros_plus_one) {
    parser->state_ = Parser::STATE_FRACTION;
    parser->negative_exponent_ = negative_exponent;
    parser->trailing_zeros_plus_one_ = trailing_zeros_plus_one;
  }
};

template <typename S, typename Traits = SignificandTraits<S>>
static DecimalError ParseDecimal(std::string_view input, Decimal<S> *result) {
  DecimalParser<S, Traits> parser;
  const DecimalError err = parser.Feed(input);
  if (err != DecimalError::kNone) return err;
  return parser.Finish(result);
}

TEST(DecimalParserTest, SimpleNumbers) {
  Decimal<int32_t> d;
  ASSERT_EQ(DecimalError::kNone, ParseDecimal("8.5", &d));
  EXPECT_EQ(Decimal<int32_t>(85, 1), d);

  ASSERT_EQ(DecimalError::kNone, ParseDecimal("148.452384", &d));
  EXPECT_EQ(148452384, d.significand());
  EXPECT_EQ(6u, d.negative_exponent());

  ASSERT_EQ(DecimalError::kNone, ParseDecimal("42", &d));
  EXPECT_EQ(Decimal<int32_t>(42, 0), d);

  ASSERT_EQ(DecimalError::kNone, ParseDecimal("-12.25", &d));
  EXPECT_EQ(Decimal<int32_t>(-1225, 2), d);

  ASSERT_EQ(DecimalError::kNone, ParseDecimal("+.5", &d));
  EXPECT_EQ(Decimal<int32_t>(5, 1), d);

  ASSERT_EQ(DecimalError::kNone, ParseDecimal("7.", &d));
  EXPECT_EQ(Decimal<int32_t>(7, 0), d);
}

TEST(DecimalParserTest, AllZerosAreTheSame) {
  const Decimal<int32_t> zero(0, 0);
  for (const char *input : { "0", "-0", "+0", "0.0", "-0.0", ".0",
                             "000", "0.000" }) {
    Decimal<int32_t> d(1, 1);
    ASSERT_EQ(DecimalError::kNone, ParseDecimal(input, &d)) << input;
    EXPECT_EQ(zero, d) << input;
  }
}

TEST(DecimalParserTest, LeadingZerosIgnored) {
  Decimal<int32_t> a, b;
  ASSERT_EQ(DecimalError::kNone, ParseDecimal("0005", &a));
  ASSERT_EQ(DecimalError::kNone, ParseDecimal("5", &b));
  EXPECT_EQ(a, b);

  ASSERT_EQ(DecimalError::kNone, ParseDecimal("-007.25", &a));
  EXPECT_EQ(Decimal<int32_t>(-725, 2), a);
}

TEST(DecimalParserTest, FractionalZeroRuns) {
  Decimal<int32_t> d;
  ASSERT_EQ(DecimalError::kNone, ParseDecimal("0.0010", &d));
  EXPECT_EQ(Decimal<int32_t>(1, 3), d);

  ASSERT_EQ(DecimalError::kNone, ParseDecimal("1.0005", &d));
  EXPECT_EQ(Decimal<int32_t>(10005, 4), d);

  ASSERT_EQ(DecimalError::kNone, ParseDecimal("-2.000306", &d));
  EXPECT_EQ(Decimal<int32_t>(-2000306, 6), d);

  // Trailing zeros don't count.
  ASSERT_EQ(DecimalError::kNone, ParseDecimal("1.500", &d));
  EXPECT_EQ(Decimal<int32_t>(15, 1), d);

  // A long run of zeros that never sees a non-zero digit is harmless.
  const std::string many_zeros = "3." + std::string(100, '0');
  ASSERT_EQ(DecimalError::kNone, ParseDecimal(many_zeros, &d));
  EXPECT_EQ(Decimal<int32_t>(3, 0), d);
}

TEST(DecimalParserTest, CapacityExceeded) {
  Decimal<int32_t> d;
  EXPECT_EQ(DecimalError::kCapacity, ParseDecimal("21474.83648", &d));
  EXPECT_EQ(DecimalError::kCapacity, ParseDecimal("2147483648", &d));
  EXPECT_EQ(DecimalError::kCapacity, ParseDecimal("-2147483649", &d));
  EXPECT_EQ(DecimalError::kCapacity,
            ParseDecimal("1." + std::string(20, '0') + "1", &d));

  // Zero stays zero, so only the exponent grows here.
  ASSERT_EQ(DecimalError::kNone,
            ParseDecimal("0." + std::string(20, '0') + "1", &d));
  EXPECT_EQ(Decimal<int32_t>(1, 21), d);

  ASSERT_EQ(DecimalError::kNone, ParseDecimal("2147483647", &d));
  EXPECT_EQ(2147483647, d.significand());
  ASSERT_EQ(DecimalError::kNone, ParseDecimal("-2147483648", &d));
  EXPECT_EQ(-2147483647 - 1, d.significand());
  ASSERT_EQ(DecimalError::kNone, ParseDecimal("21474.83647", &d));
  EXPECT_EQ(Decimal<int32_t>(2147483647, 5), d);

  // The same number fits into 64 bit.
  Decimal<int64_t> wide;
  ASSERT_EQ(DecimalError::kNone, ParseDecimal("21474.83648", &wide));
  EXPECT_EQ(Decimal<int64_t>(2147483648LL, 5), wide);

  // ... but not into 16.
  Decimal<int16_t> narrow;
  EXPECT_EQ(DecimalError::kCapacity, ParseDecimal("32768", &narrow));
  EXPECT_EQ(DecimalError::kNone, ParseDecimal("-3.2768", &narrow));
}

TEST(DecimalParserTest, Incomplete) {
  Decimal<int32_t> d;
  EXPECT_EQ(DecimalError::kIncomplete, ParseDecimal("", &d));
  EXPECT_EQ(DecimalError::kIncomplete, ParseDecimal("-", &d));
  EXPECT_EQ(DecimalError::kIncomplete, ParseDecimal("+", &d));
  EXPECT_EQ(DecimalError::kIncomplete, ParseDecimal(".", &d));
  EXPECT_EQ(DecimalError::kIncomplete, ParseDecimal("-.", &d));
}

TEST(DecimalParserTest, InvalidCharacter) {
  DecimalParser<int32_t> parser;
  EXPECT_EQ(DecimalError::kNone, parser.Feed("4904"));
  EXPECT_EQ(DecimalError::kInvalidCharacter, parser.Feed('-'));

  Decimal<int32_t> d;
  EXPECT_EQ(DecimalError::kInvalidCharacter, ParseDecimal("4904-3957", &d));
  EXPECT_EQ(DecimalError::kInvalidCharacter, ParseDecimal("1.2.3", &d));
  EXPECT_EQ(DecimalError::kInvalidCharacter, ParseDecimal("--1", &d));
  EXPECT_EQ(DecimalError::kInvalidCharacter, ParseDecimal("1e5", &d));
  EXPECT_EQ(DecimalError::kInvalidCharacter, ParseDecimal("..5", &d));
  EXPECT_EQ(DecimalError::kInvalidCharacter, ParseDecimal(" 1", &d));
}

TEST(DecimalParserTest, InvalidCharacterPosition) {
  DecimalParser<int32_t> parser;
  size_t consumed = 42;
  EXPECT_EQ(DecimalError::kInvalidCharacter,
            parser.Feed("4904-3957", &consumed));
  EXPECT_EQ(4u, consumed);

  parser.Reset();
  EXPECT_EQ(DecimalError::kCapacity, parser.Feed("21474.83648", &consumed));
  EXPECT_EQ(10u, consumed);

  parser.Reset();
  EXPECT_EQ(DecimalError::kNone, parser.Feed("-1.25", &consumed));
  EXPECT_EQ(5u, consumed);
}

TEST(DecimalParserTest, TrailingZeroCounterOverflow) {
  DecimalParser<int32_t> parser;
  DecimalParserTestPeer::SetFraction(&parser, 0, UINT32_MAX - 1);
  EXPECT_EQ(DecimalError::kNone, parser.Feed('0'));
  EXPECT_EQ(DecimalError::kCapacity, parser.Feed('0'));

  parser.Reset();
  DecimalParserTestPeer::SetFraction(&parser, 0, UINT32_MAX);
  EXPECT_EQ(DecimalError::kCapacity, parser.Feed('0'));
}

TEST(DecimalParserTest, NegativeExponentOverflow) {
  // Significand zero, so only the exponent can overflow.
  DecimalParser<int32_t> parser;
  DecimalParserTestPeer::SetFraction(&parser, UINT32_MAX - 1, 1);
  EXPECT_EQ(DecimalError::kNone, parser.Feed('5'));
  Decimal<int32_t> d;
  ASSERT_EQ(DecimalError::kNone, parser.Finish(&d));
  EXPECT_EQ(Decimal<int32_t>(5, UINT32_MAX), d);

  parser.Reset();
  DecimalParserTestPeer::SetFraction(&parser, UINT32_MAX, 1);
  EXPECT_EQ(DecimalError::kCapacity, parser.Feed('5'));

  // A pending zero run pushes it over, too.
  parser.Reset();
  DecimalParserTestPeer::SetFraction(&parser, UINT32_MAX - 2, 3);
  EXPECT_EQ(DecimalError::kCapacity, parser.Feed('5'));
}

TEST(DecimalParserTest, ChunkingDoesNotMatter) {
  const std::string input = "-1234.000567";
  Decimal<int64_t> expected;
  ASSERT_EQ(DecimalError::kNone, ParseDecimal(input, &expected));
  for (size_t split = 0; split <= input.length(); ++split) {
    DecimalParser<int64_t> parser;
    ASSERT_EQ(DecimalError::kNone, parser.Feed(input.substr(0, split)));
    ASSERT_EQ(DecimalError::kNone, parser.Feed(input.substr(split)));
    Decimal<int64_t> d;
    ASSERT_EQ(DecimalError::kNone, parser.Finish(&d));
    EXPECT_EQ(expected, d) << "split at " << split;
  }
}

TEST(DecimalParserTest, StrategiesAgree) {
  typedef SignificandTraits<int32_t, Mul10Strategy::kMultiply> Multiply;
  typedef SignificandTraits<int32_t, Mul10Strategy::kShiftAdd> ShiftAdd;
  for (const char *input : { "8.5", "-0.0010", "21474.83647", "21474.83648",
                             "-2147483648", "0.000000001", "0.0000000001" }) {
    Decimal<int32_t> a, b;
    const DecimalError err_a = ParseDecimal<int32_t, Multiply>(input, &a);
    const DecimalError err_b = ParseDecimal<int32_t, ShiftAdd>(input, &b);
    EXPECT_EQ(err_a, err_b) << input;
    if (err_a == DecimalError::kNone) {
      EXPECT_EQ(a, b) << input;
    }
  }
}

TEST(DecimalParserTest, IsPlainInteger) {
  DecimalParser<int32_t> parser;
  EXPECT_FALSE(parser.IsPlainInteger());
  parser.Feed("12");
  EXPECT_TRUE(parser.IsPlainInteger());
  parser.Feed('.');
  EXPECT_FALSE(parser.IsPlainInteger());

  parser.Reset();
  parser.Feed("-3");
  EXPECT_FALSE(parser.IsPlainInteger());
}

TEST(DecimalParserTest, ErrorNames) {
  EXPECT_STREQ("Capacity", DecimalErrorName(DecimalError::kCapacity));
  EXPECT_STREQ("InvalidCharacter",
               DecimalErrorName(DecimalError::kInvalidCharacter));
}

template <typename S>
static std::string Format(S significand, uint32_t negative_exponent) {
  char buffer[64];
  FormatDecimal(Decimal<S>(significand, negative_exponent),
                buffer, sizeof(buffer));
  return buffer;
}

TEST(FormatDecimalTest, Basic) {
  EXPECT_EQ("0", Format<int32_t>(0, 0));
  EXPECT_EQ("8.5", Format<int32_t>(85, 1));
  EXPECT_EQ("-8.5", Format<int32_t>(-85, 1));
  EXPECT_EQ("0.005", Format<int32_t>(5, 3));
  EXPECT_EQ("-0.025", Format<int32_t>(-25, 3));
  EXPECT_EQ("148.452384", Format<int32_t>(148452384, 6));
  EXPECT_EQ("-2147483648", Format<int32_t>(-2147483647 - 1, 0));
  EXPECT_EQ("-9223372036854775808",
            Format<int64_t>(std::numeric_limits<int64_t>::min(), 0));
  EXPECT_EQ("-327.68", Format<int16_t>(-32768, 2));
}

TEST(FormatDecimalTest, Truncation) {
  char buffer[4];
  EXPECT_EQ(7, FormatDecimal(Decimal<int32_t>(-12345, 2),
                             buffer, sizeof(buffer)));
  EXPECT_STREQ("-12", buffer);
}

}  // namespace fixg

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
