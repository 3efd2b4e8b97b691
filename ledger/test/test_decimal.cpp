#include "Decimal.h"
#include <gtest/gtest.h>

#include <sstream>

namespace {

txl::Decimal dec(const std::string &text) {
    auto result = txl::Decimal::parse(text);
    if (!result) {
        ADD_FAILURE() << "parse failed for '" << text << "': " << result.error().message;
        return txl::Decimal();
    }
    return result.value();
}

txl::PositiveAmount amount(const std::string &text) {
    return txl::PositiveAmount::parse(text).value();
}

} // namespace

TEST(DecimalTest, DefaultIsZero) {
    txl::Decimal zero;
    EXPECT_TRUE(zero.isZero());
    EXPECT_EQ(zero.units(), 0);
    EXPECT_EQ(zero.toString(), "0.0000");
}

TEST(DecimalTest, ParsesPlainLiterals) {
    EXPECT_EQ(dec("12").units(), 120000);
    EXPECT_EQ(dec("1.5").units(), 15000);
    EXPECT_EQ(dec("0.0001").units(), 1);
    EXPECT_EQ(dec(".25").units(), 2500);
    EXPECT_EQ(dec("3.").units(), 30000);
    EXPECT_EQ(dec("-2.75").units(), -27500);
    EXPECT_EQ(dec("+4").units(), 40000);
}

TEST(DecimalTest, TrailingZerosBeyondFourDigitsAreAccepted) {
    EXPECT_EQ(dec("1.234500").units(), 12345);
}

TEST(DecimalTest, RejectsExcessPrecision) {
    auto result = txl::Decimal::parse("1.23456");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, txl::Decimal::E_PRECISION);
}

TEST(DecimalTest, RejectsMalformedInput) {
    for (const char *text : { "", "abc", "1.2.3", "-", ".", "1e5", " 1", "1,5" }) {
        auto result = txl::Decimal::parse(text);
        ASSERT_TRUE(result.isError()) << "accepted '" << text << "'";
        EXPECT_EQ(result.error().code, txl::Decimal::E_PARSE);
    }
}

TEST(DecimalTest, RejectsOutOfRange) {
    auto result = txl::Decimal::parse("99999999999999999999");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, txl::Decimal::E_OVERFLOW);

    EXPECT_TRUE(txl::Decimal::parse("922337203685477.5807").isOk());
    EXPECT_TRUE(txl::Decimal::parse("922337203685477.5808").isError());
}

TEST(DecimalTest, ToStringAlwaysHasFourDigits) {
    EXPECT_EQ(dec("7").toString(), "7.0000");
    EXPECT_EQ(dec("-1.5").toString(), "-1.5000");
    EXPECT_EQ(dec("-0.0001").toString(), "-0.0001");
    EXPECT_EQ(txl::Decimal::fromUnits(INT64_MIN).toString(), "-922337203685477.5808");

    std::ostringstream ss;
    ss << dec("2.5");
    EXPECT_EQ(ss.str(), "2.5000");
}

TEST(DecimalTest, CheckedArithmetic) {
    auto sum = dec("1.5").checkedAdd(dec("2.25"));
    ASSERT_TRUE(sum.isOk());
    EXPECT_EQ(sum.value(), dec("3.75"));

    auto difference = dec("1").checkedSub(dec("3"));
    ASSERT_TRUE(difference.isOk());
    EXPECT_EQ(difference.value(), dec("-2"));
    EXPECT_TRUE(difference.value().isNegative());
}

TEST(DecimalTest, CheckedArithmeticDetectsOverflow) {
    auto max = txl::Decimal::fromUnits(INT64_MAX);
    auto min = txl::Decimal::fromUnits(INT64_MIN);
    auto unit = txl::Decimal::fromUnits(1);

    auto up = max.checkedAdd(unit);
    ASSERT_TRUE(up.isError());
    EXPECT_EQ(up.error().code, txl::Decimal::E_OVERFLOW);
    EXPECT_TRUE(min.checkedSub(unit).isError());
    EXPECT_TRUE(max.checkedSub(txl::Decimal::fromUnits(-1)).isError());
    EXPECT_TRUE(max.checkedSub(unit).isOk());
}

TEST(DecimalTest, Comparisons) {
    EXPECT_LT(dec("1"), dec("1.0001"));
    EXPECT_GT(dec("0"), dec("-0.5"));
    EXPECT_EQ(dec("2.50"), dec("2.5"));
    EXPECT_NE(dec("2.5"), dec("2.05"));
}

TEST(PositiveAmountTest, AcceptsPositiveValues) {
    auto result = txl::PositiveAmount::create(dec("0.0001"));
    ASSERT_TRUE(result.isOk());
    EXPECT_EQ(result.value().value().units(), 1);
    EXPECT_EQ(amount("10"), amount("10.0000"));
}

TEST(PositiveAmountTest, RejectsZeroAndNegative) {
    for (const char *text : { "0", "0.0000", "-1", "-0.0001" }) {
        auto result = txl::PositiveAmount::parse(text);
        ASSERT_TRUE(result.isError()) << "accepted '" << text << "'";
        EXPECT_EQ(result.error().code, txl::Decimal::E_INVALID_AMOUNT);
    }
}

TEST(PositiveAmountTest, ParsePropagatesDecimalErrors) {
    auto result = txl::PositiveAmount::parse("ten");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, txl::Decimal::E_PARSE);
}
