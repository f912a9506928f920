#pragma once

#include "domain/value_objects/BigDecimal.hpp"
#include "domain/value_objects/BigMoney.hpp"
#include "domain/value_objects/CurrencyUnit.hpp"
#include "format/Locale.hpp"
#include "repositories/ICurrencyRepository.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace dme::format {

// Mutable state of a single parse call. Each parser either advances the
// index past what it consumed or records an error index and leaves the
// index where it was. The context shares ownership of the currency
// repository so it stays usable after the formatter is gone.
class ParseContext {
public:
    ParseContext(Locale locale, std::string text, int index,
                 std::shared_ptr<const dme::repositories::ICurrencyRepository> currencies);

    const Locale& locale() const noexcept { return locale_; }
    const std::string& text() const noexcept { return text_; }
    int text_length() const noexcept { return static_cast<int>(text_.size()); }
    std::string_view text_substring(int start, int end) const;

    int index() const noexcept { return index_; }
    void set_index(int index);

    int error_index() const noexcept { return error_index_; }
    void set_error_index(int index) { error_index_ = index; }
    void set_error() { error_index_ = index_; }
    bool is_error() const noexcept { return error_index_ >= 0; }
    bool is_fully_parsed() const noexcept { return index_ == text_length(); }
    // No error, and both a currency and an amount were parsed
    bool is_complete() const noexcept { return !is_error() && currency_ && amount_; }

    const std::optional<dme::domain::CurrencyUnit>& currency() const noexcept { return currency_; }
    void set_currency(dme::domain::CurrencyUnit currency) { currency_ = std::move(currency); }
    const std::optional<dme::domain::BigDecimal>& amount() const noexcept { return amount_; }
    void set_amount(dme::domain::BigDecimal amount) { amount_ = std::move(amount); }

    const dme::repositories::ICurrencyRepository& currencies() const noexcept { return *currencies_; }

    // Throws FormatParseError when the currency or amount is missing
    dme::domain::BigMoney to_big_money() const;

private:
    Locale locale_;
    std::string text_;
    int index_;
    int error_index_{-1};
    std::optional<dme::domain::CurrencyUnit> currency_;
    std::optional<dme::domain::BigDecimal> amount_;
    std::shared_ptr<const dme::repositories::ICurrencyRepository> currencies_;
};

} // namespace dme::format
