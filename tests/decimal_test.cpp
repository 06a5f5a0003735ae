#include <gtest/gtest.h>

#include "decimal.hpp"

TEST(Decimal, ParsesSignedAmounts) {
  EXPECT_EQ(Decimal::parse("12").value().cents(), 1200);
  EXPECT_EQ(Decimal::parse("12.3").value().cents(), 1230);
  EXPECT_EQ(Decimal::parse("-12.34").value().cents(), -1234);
  EXPECT_EQ(Decimal::parse("+0.05").value().cents(), 5);
  EXPECT_EQ(Decimal::parse(".5").value().cents(), 50);
}

TEST(Decimal, RejectsMalformedAmounts) {
  for(auto text : {"", "-", "1.234", "1.2.3", "12a", "$5"}) {
    auto parsed = Decimal::parse(text);
    ASSERT_FALSE(parsed.has_value()) << text;
    EXPECT_EQ(parsed.error().code, UNEXPECTED_CODE::VALIDATION);
  }
}

TEST(Decimal, FormatsWithTwoDigits) {
  EXPECT_EQ(Decimal::fromCents(-1234).toString(), "-12.34");
  EXPECT_EQ(Decimal::fromCents(5).toString(), "0.05");
  EXPECT_EQ(Decimal::fromCents(-5).toString(), "-0.05");
  EXPECT_EQ(Decimal::fromUnits(7).toString(), "7.00");
}

TEST(Decimal, RoundsDoublesToTheNearestCent) {
  EXPECT_EQ(Decimal::fromDouble(0.1 + 0.2).cents(), 30);
  EXPECT_EQ(Decimal::fromDouble(-19.999).cents(), -2000);
}

TEST(Decimal, ArithmeticStaysExact) {
  Decimal total;
  for(int i = 0; i < 10; ++i) {
    total += Decimal::fromCents(10);
  }
  EXPECT_EQ(total, Decimal::fromUnits(1));
  EXPECT_EQ((Decimal::fromUnits(3) - Decimal::fromUnits(5)).abs(), Decimal::fromUnits(2));
  EXPECT_LT(-Decimal::fromUnits(1), Decimal{});
}

TEST(Decimal, DividesRoundingHalfAwayFromZero) {
  EXPECT_EQ(Decimal::fromCents(5).dividedBy(2).cents(), 3);
  EXPECT_EQ(Decimal::fromCents(-5).dividedBy(2).cents(), -3);
  EXPECT_EQ(Decimal::fromCents(1000).dividedBy(3).cents(), 333);
}
