#include "domain/value_objects/CurrencyUnit.hpp"

#include <gtest/gtest.h>

using dme::domain::CurrencyUnit;

TEST(CurrencyUnit, ConstructsWithValidFields) {
    CurrencyUnit usd("USD", 840, 2, {{"en_US", "$"}});
    EXPECT_EQ(usd.code(), "USD");
    EXPECT_EQ(usd.numeric_code(), 840);
    EXPECT_EQ(usd.default_fraction_digits(), 2);
    EXPECT_EQ(usd.decimal_places(), 2);
    EXPECT_FALSE(usd.is_pseudo_currency());
}

TEST(CurrencyUnit, ThrowsOnInvalidCode) {
    EXPECT_THROW(CurrencyUnit("US", 840, 2), std::invalid_argument);
    EXPECT_THROW(CurrencyUnit("usd", 840, 2), std::invalid_argument);
    EXPECT_THROW(CurrencyUnit("US1", 840, 2), std::invalid_argument);
    EXPECT_THROW(CurrencyUnit("", 840, 2), std::invalid_argument);
}

TEST(CurrencyUnit, ThrowsOnInvalidNumericCode) {
    EXPECT_THROW(CurrencyUnit("USD", 1000, 2), std::invalid_argument);
    EXPECT_THROW(CurrencyUnit("USD", -2, 2), std::invalid_argument);
}

TEST(CurrencyUnit, ThrowsOnNegativeFractionDigits) {
    EXPECT_THROW(CurrencyUnit("USD", 840, -2), std::invalid_argument);
}

TEST(CurrencyUnit, PseudoCurrencyUsesZeroDecimalPlaces) {
    CurrencyUnit xau("XAU", 959, -1);
    EXPECT_TRUE(xau.is_pseudo_currency());
    EXPECT_EQ(xau.default_fraction_digits(), -1);
    EXPECT_EQ(xau.decimal_places(), 0);
}

TEST(CurrencyUnit, Numeric3CodeIsZeroPadded) {
    EXPECT_EQ(CurrencyUnit("ALL", 8, 2).numeric3_code(), "008");
    EXPECT_EQ(CurrencyUnit("AUD", 36, 2).numeric3_code(), "036");
    EXPECT_EQ(CurrencyUnit("USD", 840, 2).numeric3_code(), "840");
}

TEST(CurrencyUnit, Numeric3CodeEmptyWithoutNumericCode) {
    CurrencyUnit none("ZZZ", -1, 2);
    EXPECT_FALSE(none.has_numeric_code());
    EXPECT_EQ(none.numeric3_code(), "");
}

TEST(CurrencyUnit, SymbolMatchesFullLocaleTag) {
    CurrencyUnit usd("USD", 840, 2, {{"en_US", "$"}});
    EXPECT_EQ(usd.symbol("en_US"), "$");
}

TEST(CurrencyUnit, SymbolFallsBackToLanguage) {
    CurrencyUnit eur("EUR", 978, 2, {{"de", "€"}});
    EXPECT_EQ(eur.symbol("de_AT"), "€");
}

TEST(CurrencyUnit, SymbolFallsBackToCode) {
    CurrencyUnit usd("USD", 840, 2, {{"en_US", "$"}});
    EXPECT_EQ(usd.symbol("en_GB"), "USD");
    EXPECT_EQ(usd.symbol(""), "USD");
}

TEST(CurrencyUnit, EqualityAndOrderingUseCode) {
    CurrencyUnit a("EUR", 978, 2);
    CurrencyUnit b("EUR", 978, 2, {{"de", "€"}});
    CurrencyUnit c("USD", 840, 2);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, c);
}

TEST(CurrencyUnit, CopiesShareSymbols) {
    CurrencyUnit original("GBP", 826, 2, {{"en_GB", "£"}});
    CurrencyUnit copy = original;
    EXPECT_EQ(&original.symbols(), &copy.symbols());
}
