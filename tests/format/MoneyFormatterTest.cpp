#include "format/MoneyFormatter.hpp"

#include "domain/errors/MoneyErrors.hpp"
#include "format/MoneyFormatterBuilder.hpp"
#include "infrastructure/CurrencyDataLoader.hpp"
#include "repositories/InMemoryCurrencyRepository.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace dme::format;
using dme::domain::BigDecimal;
using dme::domain::BigMoney;
using dme::domain::CurrencyUnit;
using dme::domain::FormatParseError;
using dme::domain::Money;
using dme::domain::MoneyFormatError;
using dme::domain::UnnecessaryRoundingError;
using dme::infrastructure::default_currencies;

class MoneyFormatterTest : public ::testing::Test {
protected:
    CurrencyUnit usd = default_currencies()->of("USD");
    CurrencyUnit eur = default_currencies()->of("EUR");
    CurrencyUnit all = default_currencies()->of("ALL");

    MoneyFormatter code_amount = MoneyFormatterBuilder()
                                     .append_currency_code()
                                     .append_literal(" ")
                                     .append_amount(AmountStyle::ascii_decimal_point_group3_comma())
                                     .to_formatter();

    MoneyFormatter compact = MoneyFormatterBuilder()
                                 .append_currency_code()
                                 .append_amount(AmountStyle::ascii_decimal_point_group3_comma())
                                 .to_formatter();

    BigMoney money(const CurrencyUnit& currency, const std::string& amount) {
        return BigMoney::of(currency, BigDecimal::from_string(amount));
    }
};

// --- Printing ---

TEST_F(MoneyFormatterTest, PrintsGroupedAmount) {
    EXPECT_EQ(code_amount.print(money(usd, "1234567.89")), "USD 1,234,567.89");
}

TEST_F(MoneyFormatterTest, ShortAmountHasNoSeparator) {
    EXPECT_EQ(code_amount.print(money(usd, "123")), "USD 123");
}

TEST_F(MoneyFormatterTest, PrintsMoney) {
    EXPECT_EQ(code_amount.print(Money::of_minor(usd, -150)), "USD -1.50");
}

TEST_F(MoneyFormatterTest, PrintToAppends) {
    std::string out = "Total: ";
    code_amount.print_to(out, money(eur, "3.5"));
    EXPECT_EQ(out, "Total: EUR 3.5");
}

TEST_F(MoneyFormatterTest, PrintsNumeric3Code) {
    auto formatter = MoneyFormatterBuilder().append_currency_numeric3_code().append_literal(" ").append_amount()
                         .to_formatter();
    EXPECT_EQ(formatter.print(money(all, "12")), "008 12");
}

TEST_F(MoneyFormatterTest, PrintsLocalizedSymbol) {
    auto formatter = MoneyFormatterBuilder().append_currency_symbol_localized().append_amount().to_formatter();
    EXPECT_EQ(formatter.print(money(usd, "12.50")), "$12.50");
}

TEST_F(MoneyFormatterTest, LocaleChangesAmountCharacters) {
    auto formatter = MoneyFormatterBuilder().append_amount().append_literal(" ").append_currency_code()
                         .to_formatter(Locale::germany());
    EXPECT_EQ(formatter.print(money(eur, "1234567.89")), "1.234.567,89 EUR");
    EXPECT_EQ(formatter.with_locale(Locale::us()).print(money(eur, "1234567.89")), "1,234,567.89 EUR");
}

TEST_F(MoneyFormatterTest, PrintUnsupportedThrows) {
    auto formatter = MoneyFormatterBuilder().append(UserPrinterParser{nullptr, nullptr}).to_formatter();
    EXPECT_FALSE(formatter.is_print_supported());
    EXPECT_THROW(formatter.print(money(usd, "1")), MoneyFormatError);
}

// --- Parsing ---

TEST_F(MoneyFormatterTest, RoundTrip) {
    auto original = money(usd, "1234567.89");
    EXPECT_EQ(code_amount.parse_big_money(code_amount.print(original)), original);
}

TEST_F(MoneyFormatterTest, ParseMoneyRequiresCurrencyScale) {
    EXPECT_EQ(code_amount.parse_money("USD 12.5").to_string(), "USD 12.50");
    EXPECT_THROW(code_amount.parse_money("USD 12.555"), UnnecessaryRoundingError);
}

TEST_F(MoneyFormatterTest, ParseErrorReportsIndex) {
    try {
        compact.parse_big_money("US12.34");
        FAIL() << "Expected FormatParseError";
    } catch (const FormatParseError& e) {
        EXPECT_EQ(e.error_index(), 2);
        EXPECT_EQ(e.text(), "US12.34");
        EXPECT_EQ(std::string(e.what()), "Text could not be parsed at index 2: US12.34");
    }
}

TEST_F(MoneyFormatterTest, ParseStopsAtFirstError) {
    auto context = code_amount.parse("USD-12");
    EXPECT_TRUE(context.is_error());
    EXPECT_EQ(context.error_index(), 3);
    EXPECT_TRUE(context.currency().has_value());
    EXPECT_FALSE(context.amount().has_value());
}

TEST_F(MoneyFormatterTest, UnparsedTextFails) {
    try {
        code_amount.parse_big_money("USD 12.34 extra");
        FAIL() << "Expected FormatParseError";
    } catch (const FormatParseError& e) {
        EXPECT_EQ(e.error_index(), 9);
    }
}

TEST_F(MoneyFormatterTest, ParseFromStartIndex) {
    auto context = code_amount.parse("Price: USD 7.25", 7);
    EXPECT_FALSE(context.is_error());
    EXPECT_TRUE(context.is_fully_parsed());
    EXPECT_EQ(context.to_big_money(), money(usd, "7.25"));
}

TEST_F(MoneyFormatterTest, MissingCurrencyFails) {
    auto formatter = MoneyFormatterBuilder().append_amount().to_formatter();
    EXPECT_THROW(formatter.parse_big_money("12.34"), FormatParseError);
}

TEST_F(MoneyFormatterTest, MissingAmountFails) {
    auto formatter = MoneyFormatterBuilder().append_currency_code().to_formatter();
    EXPECT_THROW(formatter.parse_big_money("USD"), FormatParseError);
}

TEST_F(MoneyFormatterTest, ParseGermanLocale) {
    auto formatter = MoneyFormatterBuilder().append_amount().append_literal(" ").append_currency_code()
                         .to_formatter(Locale::germany());
    EXPECT_EQ(formatter.parse_big_money("1.234,5 EUR"), money(eur, "1234.5"));
}

TEST_F(MoneyFormatterTest, ParseUnsupportedWithSymbol) {
    auto formatter = MoneyFormatterBuilder().append_currency_symbol_localized().append_amount().to_formatter();
    EXPECT_TRUE(formatter.is_print_supported());
    EXPECT_FALSE(formatter.is_parse_supported());
    EXPECT_THROW(formatter.parse_big_money("$12.50"), MoneyFormatError);
    EXPECT_THROW(formatter.parse("$12.50"), MoneyFormatError);
}

TEST_F(MoneyFormatterTest, ParseNumericCode) {
    auto formatter = MoneyFormatterBuilder().append_currency_numeric3_code().append_literal(" ").append_amount()
                         .to_formatter();
    EXPECT_EQ(formatter.parse_big_money("840 1,000"), money(usd, "1000"));
}

TEST_F(MoneyFormatterTest, WithCurrenciesRestrictsParsing) {
    auto repo = std::make_shared<dme::repositories::InMemoryCurrencyRepository>();
    repo->register_currency(CurrencyUnit("EUR", 978, 2));
    auto restricted = code_amount.with_currencies(repo);

    EXPECT_EQ(restricted.parse_big_money("EUR 1.00"), money(eur, "1.00"));
    EXPECT_THROW(restricted.parse_big_money("USD 1.00"), FormatParseError);
}

TEST_F(MoneyFormatterTest, ParseResultOutlivesFormatterAndRepository) {
    auto repo = std::make_shared<dme::repositories::InMemoryCurrencyRepository>();
    repo->register_currency(CurrencyUnit("USD", 840, 2));
    auto context = MoneyFormatterBuilder().append_currency_code().to_formatter(Locale::us(), repo).parse("USD");
    repo.reset();

    ASSERT_TRUE(context.currency().has_value());
    EXPECT_EQ(context.currency()->code(), "USD");
    auto found = context.currencies().find_by_code("USD");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->numeric_code(), 840);
}

TEST_F(MoneyFormatterTest, RejectsNullParts) {
    EXPECT_THROW(MoneyFormatter(Locale::us(), nullptr, default_currencies()), std::invalid_argument);
    EXPECT_THROW(code_amount.with_currencies(nullptr), std::invalid_argument);
}

// --- Sharing ---

TEST_F(MoneyFormatterTest, SharedBetweenThreads) {
    auto formatter = MoneyFormatterBuilder().append_amount().to_formatter();
    auto german = formatter.with_locale(Locale::germany());
    auto value = money(usd, "1234.5");

    std::vector<std::string> us_results(4);
    std::vector<std::string> de_results(4);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < 4; ++i) {
        threads.emplace_back([&, i] {
            for (int n = 0; n < 200; ++n) {
                us_results[i] = formatter.print(value);
                de_results[i] = german.print(value);
            }
        });
    }
    for (auto& t : threads) t.join();

    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(us_results[i], "1,234.5");
        EXPECT_EQ(de_results[i], "1.234,5");
    }
}
