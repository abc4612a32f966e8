#include "money.hpp"

#include <gtest/gtest.h>

using namespace wallet;

TEST(MoneyTest, ParsesWholeAndFractionalAmounts) {
  EXPECT_EQ(parseAmount("100"), 10000);
  EXPECT_EQ(parseAmount("12.5"), 1250);
  EXPECT_EQ(parseAmount("12.05"), 1205);
  EXPECT_EQ(parseAmount("0.01"), 1);
  EXPECT_EQ(parseAmount(".5"), 50);
  EXPECT_EQ(parseAmount("7."), 700);
}

TEST(MoneyTest, AcceptsCommaAsDecimalSeparator) {
  EXPECT_EQ(parseAmount("12,50"), 1250);
  EXPECT_EQ(parseAmount("0,99"), 99);
}

TEST(MoneyTest, KeepsSignAndTrimsWhitespace) {
  EXPECT_EQ(parseAmount("-3.10"), -310);
  EXPECT_EQ(parseAmount("+4"), 400);
  EXPECT_EQ(parseAmount("  25.00 "), 2500);
  EXPECT_EQ(parseAmount("0"), 0);
}

TEST(MoneyTest, RejectsMalformedText) {
  EXPECT_FALSE(parseAmount("").has_value());
  EXPECT_FALSE(parseAmount("   ").has_value());
  EXPECT_FALSE(parseAmount("abc").has_value());
  EXPECT_FALSE(parseAmount("12a").has_value());
  EXPECT_FALSE(parseAmount("1.2.3").has_value());
  EXPECT_FALSE(parseAmount("1,2.3").has_value());
  EXPECT_FALSE(parseAmount("1.234").has_value());
  EXPECT_FALSE(parseAmount("-").has_value());
  EXPECT_FALSE(parseAmount(".").has_value());
}

TEST(MoneyTest, RejectsAmountsBeyondLimit) {
  EXPECT_TRUE(parseAmount("10000000000000000").has_value());
  EXPECT_FALSE(parseAmount("10000000000000000.01").has_value());
  EXPECT_FALSE(parseAmount("99999999999999999999999").has_value());
}

TEST(MoneyTest, FormatsCents) {
  EXPECT_EQ(formatAmount(1234), "12.34");
  EXPECT_EQ(formatAmount(5), "0.05");
  EXPECT_EQ(formatAmount(0), "0.00");
  EXPECT_EQ(formatAmount(10000), "100.00");
  EXPECT_EQ(formatAmount(-310), "-3.10");
}
