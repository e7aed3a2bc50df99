// =============================================================================
// value_parser_test.cpp
// =============================================================================
// Unit tests for perspective::values.
//
// Validates:
//   - Tuple / list literal strings parse into typed member lists
//   - Quotes and whitespace are stripped, empty items dropped
//   - Arrays pass through, scalars become one-element lists
//   - fncriteria ranges and 2-element arrays parse; malformed input is nullopt
// =============================================================================

#include "perspective/value_parser.hpp"

#include <gtest/gtest.h>

using namespace perspective;

TEST(ValueParserTest, TupleStringParsesToIntegers) {
  auto items = values::parse_list("(4,8,9)");
  ASSERT_EQ(items.size(), 3u);
  EXPECT_EQ(items[0], 4);
  EXPECT_EQ(items[1], 8);
  EXPECT_EQ(items[2], 9);
  EXPECT_TRUE(items[0].is_number_integer());
}

TEST(ValueParserTest, BracketListKeepsQuotedStrings) {
  auto items = values::parse_list("['USD', \"EUR\" , GBP]");
  ASSERT_EQ(items.size(), 3u);
  EXPECT_EQ(items[0], "USD");
  EXPECT_EQ(items[1], "EUR");
  EXPECT_EQ(items[2], "GBP");
}

TEST(ValueParserTest, NegativeNumbersAndEmptyItems) {
  auto items = values::parse_list("(-2147483648, ,12,)");
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0], -2147483648LL);
  EXPECT_EQ(items[1], 12);
}

TEST(ValueParserTest, DecimalStaysString) {
  auto items = values::parse_list("(1.5)");
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0], "1.5");
}

TEST(ValueParserTest, ArrayAndScalarInputs) {
  auto arr = values::parse_list(json::array({1, "a"}));
  ASSERT_EQ(arr.size(), 2u);
  EXPECT_EQ(arr[1], "a");

  auto scalar = values::parse_list(json(7));
  ASSERT_EQ(scalar.size(), 1u);
  EXPECT_EQ(scalar[0], 7);

  EXPECT_TRUE(values::parse_list("()").empty());
}

TEST(ValueParserTest, FncriteriaRange) {
  auto r = values::parse_range("fncriteria:0:10.5");
  ASSERT_TRUE(r.has_value());
  EXPECT_DOUBLE_EQ(r->first.get<double>(), 0.0);
  EXPECT_DOUBLE_EQ(r->second.get<double>(), 10.5);
}

TEST(ValueParserTest, RangeFromArrayAndMalformed) {
  auto r = values::parse_range(json::array({1, 5}));
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->first, 1);
  EXPECT_EQ(r->second, 5);

  EXPECT_FALSE(values::parse_range(json::array({1, 2, 3})).has_value());
  EXPECT_FALSE(values::parse_range("0:10").has_value());
  EXPECT_FALSE(values::parse_range("fncriteria:5").has_value());
  EXPECT_FALSE(values::parse_range(json(3)).has_value());
}

TEST(ValueParserTest, ScalarStripsQuotes) {
  EXPECT_EQ(values::parse_scalar("'abc'"), "abc");
  EXPECT_EQ(values::parse_scalar(json(3)), 3);
}
