#include "domain/value_objects/BigDecimal.hpp"

#include "domain/errors/MoneyErrors.hpp"

#include <gtest/gtest.h>

using namespace dme::domain;

namespace {

BigDecimal dec(const std::string& str) {
    return BigDecimal::from_string(str);
}

std::string round_to(const std::string& value, int32_t scale, RoundingMode mode) {
    return dec(value).with_scale(scale, mode).to_plain_string();
}

} // namespace

// --- Construction ---

TEST(BigDecimal, DefaultIsZero) {
    BigDecimal zero;
    EXPECT_TRUE(zero.is_zero());
    EXPECT_EQ(zero.scale(), 0);
    EXPECT_EQ(zero.to_plain_string(), "0");
}

TEST(BigDecimal, ThrowsOnNegativeScale) {
    EXPECT_THROW(BigDecimal(1, -1), std::invalid_argument);
}

TEST(BigDecimal, FromStringReadsScale) {
    auto d = dec("1234.560");
    EXPECT_EQ(d.unscaled_value(), BigDecimal::Integer(1234560));
    EXPECT_EQ(d.scale(), 3);
}

TEST(BigDecimal, FromStringReadsSign) {
    EXPECT_EQ(dec("-12.5").unscaled_value(), BigDecimal::Integer(-125));
    EXPECT_EQ(dec("+12.5").unscaled_value(), BigDecimal::Integer(125));
}

TEST(BigDecimal, FromStringAcceptsLeadingDecimalPoint) {
    auto d = dec(".05");
    EXPECT_EQ(d.unscaled_value(), BigDecimal::Integer(5));
    EXPECT_EQ(d.scale(), 2);
}

TEST(BigDecimal, FromStringHandlesValuesBeyondInt64) {
    auto d = dec("123456789012345678901234567890.12");
    EXPECT_EQ(d.to_plain_string(), "123456789012345678901234567890.12");
}

TEST(BigDecimal, FromStringThrowsOnInvalid) {
    EXPECT_THROW(dec(""), std::invalid_argument);
    EXPECT_THROW(dec("-"), std::invalid_argument);
    EXPECT_THROW(dec("1.2.3"), std::invalid_argument);
    EXPECT_THROW(dec("12a"), std::invalid_argument);
    EXPECT_THROW(dec("1E+3"), std::invalid_argument);
}

// --- Plain string ---

TEST(BigDecimal, PlainStringPadsSmallFractions) {
    EXPECT_EQ(BigDecimal(5, 3).to_plain_string(), "0.005");
    EXPECT_EQ(BigDecimal(-5, 3).to_plain_string(), "-0.005");
    EXPECT_EQ(BigDecimal(0, 2).to_plain_string(), "0.00");
}

TEST(BigDecimal, PlainStringOfLargeNegativeValue) {
    EXPECT_EQ(dec("-98765432109876543210987.654").to_plain_string(), "-98765432109876543210987.654");
    EXPECT_EQ(dec("-98765432109876543210987.655").with_scale(2, RoundingMode::HALF_EVEN).to_plain_string(),
              "-98765432109876543210987.66");
}

// --- Arithmetic ---

TEST(BigDecimal, PlusAlignsToWiderScale) {
    auto sum = dec("10.00").plus(dec("5.005"));
    EXPECT_EQ(sum.unscaled_value(), BigDecimal::Integer(15005));
    EXPECT_EQ(sum.scale(), 3);
}

TEST(BigDecimal, MinusCanGoNegative) {
    EXPECT_EQ(dec("1.5").minus(dec("2.25")).to_plain_string(), "-0.75");
}

TEST(BigDecimal, MultipliedByAddsScales) {
    auto product = dec("1.25").multiplied_by(dec("0.5"));
    EXPECT_EQ(product.to_plain_string(), "0.625");
    EXPECT_EQ(product.scale(), 3);
}

TEST(BigDecimal, DividedByRoundsAtRequestedScale) {
    EXPECT_EQ(dec("1").divided_by(dec("3"), 2, RoundingMode::HALF_UP).to_plain_string(), "0.33");
    EXPECT_EQ(dec("2").divided_by(dec("3"), 2, RoundingMode::HALF_UP).to_plain_string(), "0.67");
    EXPECT_EQ(dec("10.00").divided_by(dec("0.4"), 2, RoundingMode::UNNECESSARY).to_plain_string(), "25.00");
}

TEST(BigDecimal, DividedByNonTerminatingFailsWhenRoundingUnnecessary) {
    EXPECT_THROW(dec("1").divided_by(dec("3"), 10, RoundingMode::UNNECESSARY), UnnecessaryRoundingError);
}

TEST(BigDecimal, DividedByZeroThrows) {
    EXPECT_THROW(dec("1").divided_by(dec("0.00"), 2, RoundingMode::HALF_UP), std::invalid_argument);
}

TEST(BigDecimal, WithScaleIncreasesExactly) {
    auto d = dec("1.5").with_scale(4);
    EXPECT_EQ(d.to_plain_string(), "1.5000");
}

TEST(BigDecimal, WithScaleThrowsOnNegativeScale) {
    EXPECT_THROW(dec("1.5").with_scale(-1), std::invalid_argument);
}

TEST(BigDecimal, StripTrailingZeros) {
    EXPECT_EQ(dec("12.3400").strip_trailing_zeros().to_plain_string(), "12.34");
    EXPECT_EQ(dec("100").strip_trailing_zeros().to_plain_string(), "100");
    EXPECT_EQ(dec("0.000").strip_trailing_zeros().scale(), 0);
}

TEST(BigDecimal, NegatedAndAbs) {
    EXPECT_EQ(dec("2.5").negated().to_plain_string(), "-2.5");
    EXPECT_EQ(dec("-2.5").abs().to_plain_string(), "2.5");
    EXPECT_EQ(dec("0").negated().signum(), 0);
}

// --- Rounding modes ---

TEST(BigDecimal, RoundingUp) {
    EXPECT_EQ(round_to("5.5", 0, RoundingMode::UP), "6");
    EXPECT_EQ(round_to("1.1", 0, RoundingMode::UP), "2");
    EXPECT_EQ(round_to("-1.1", 0, RoundingMode::UP), "-2");
    EXPECT_EQ(round_to("-2.5", 0, RoundingMode::UP), "-3");
}

TEST(BigDecimal, RoundingDown) {
    EXPECT_EQ(round_to("5.5", 0, RoundingMode::DOWN), "5");
    EXPECT_EQ(round_to("1.9", 0, RoundingMode::DOWN), "1");
    EXPECT_EQ(round_to("-1.9", 0, RoundingMode::DOWN), "-1");
}

TEST(BigDecimal, RoundingCeiling) {
    EXPECT_EQ(round_to("1.1", 0, RoundingMode::CEILING), "2");
    EXPECT_EQ(round_to("-1.1", 0, RoundingMode::CEILING), "-1");
    EXPECT_EQ(round_to("-2.5", 0, RoundingMode::CEILING), "-2");
}

TEST(BigDecimal, RoundingFloor) {
    EXPECT_EQ(round_to("1.9", 0, RoundingMode::FLOOR), "1");
    EXPECT_EQ(round_to("-1.1", 0, RoundingMode::FLOOR), "-2");
    EXPECT_EQ(round_to("-2.5", 0, RoundingMode::FLOOR), "-3");
}

TEST(BigDecimal, RoundingHalfUp) {
    EXPECT_EQ(round_to("5.5", 0, RoundingMode::HALF_UP), "6");
    EXPECT_EQ(round_to("2.5", 0, RoundingMode::HALF_UP), "3");
    EXPECT_EQ(round_to("1.6", 0, RoundingMode::HALF_UP), "2");
    EXPECT_EQ(round_to("1.1", 0, RoundingMode::HALF_UP), "1");
    EXPECT_EQ(round_to("-2.5", 0, RoundingMode::HALF_UP), "-3");
}

TEST(BigDecimal, RoundingHalfDown) {
    EXPECT_EQ(round_to("5.5", 0, RoundingMode::HALF_DOWN), "5");
    EXPECT_EQ(round_to("1.6", 0, RoundingMode::HALF_DOWN), "2");
    EXPECT_EQ(round_to("-2.5", 0, RoundingMode::HALF_DOWN), "-2");
    EXPECT_EQ(round_to("-2.51", 0, RoundingMode::HALF_DOWN), "-3");
}

TEST(BigDecimal, RoundingHalfEven) {
    EXPECT_EQ(round_to("5.5", 0, RoundingMode::HALF_EVEN), "6");
    EXPECT_EQ(round_to("2.5", 0, RoundingMode::HALF_EVEN), "2");
    EXPECT_EQ(round_to("1.6", 0, RoundingMode::HALF_EVEN), "2");
    EXPECT_EQ(round_to("-2.5", 0, RoundingMode::HALF_EVEN), "-2");
    EXPECT_EQ(round_to("-5.5", 0, RoundingMode::HALF_EVEN), "-6");
    EXPECT_EQ(round_to("0.125", 2, RoundingMode::HALF_EVEN), "0.12");
}

TEST(BigDecimal, RoundingUnnecessary) {
    EXPECT_EQ(round_to("1.00", 0, RoundingMode::UNNECESSARY), "1");
    EXPECT_THROW(round_to("1.01", 0, RoundingMode::UNNECESSARY), UnnecessaryRoundingError);
}

TEST(BigDecimal, RoundingNeverTouchesExactValues) {
    for (auto mode : {RoundingMode::UP, RoundingMode::DOWN, RoundingMode::CEILING, RoundingMode::FLOOR,
                      RoundingMode::HALF_UP, RoundingMode::HALF_DOWN, RoundingMode::HALF_EVEN,
                      RoundingMode::UNNECESSARY}) {
        EXPECT_EQ(round_to("-7.000", 1, mode), "-7.0");
    }
}

// --- Comparison ---

TEST(BigDecimal, ComparesNumericallyAcrossScales) {
    EXPECT_EQ(dec("1.0"), dec("1.00"));
    EXPECT_LT(dec("1.09"), dec("1.1"));
    EXPECT_GT(dec("-1.09"), dec("-1.1"));
}
