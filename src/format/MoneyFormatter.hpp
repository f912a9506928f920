#pragma once

#include "domain/value_objects/BigMoney.hpp"
#include "domain/value_objects/Money.hpp"
#include "format/Locale.hpp"
#include "format/ParseContext.hpp"
#include "format/PrinterParsers.hpp"
#include "repositories/ICurrencyRepository.hpp"

#include <memory>
#include <string>
#include <vector>

namespace dme::format {

// Prints and parses monetary amounts using a fixed sequence of elements.
// Immutable and safe to share between threads; created by MoneyFormatterBuilder.
class MoneyFormatter {
public:
    using Elements = std::vector<PrinterParser>;

    MoneyFormatter(Locale locale, std::shared_ptr<const Elements> elements,
                   std::shared_ptr<const dme::repositories::ICurrencyRepository> currencies);

    const Locale& locale() const noexcept { return locale_; }
    MoneyFormatter with_locale(Locale locale) const;
    MoneyFormatter with_currencies(std::shared_ptr<const dme::repositories::ICurrencyRepository> currencies) const;
    const Elements& elements() const noexcept { return *elements_; }

    bool is_print_supported() const;
    bool is_parse_supported() const;

    // Printing, throws MoneyFormatError when an element cannot print
    std::string print(const dme::domain::BigMoney& money) const;
    std::string print(const dme::domain::Money& money) const;
    void print_to(std::string& out, const dme::domain::BigMoney& money) const;

    // Parses the whole text, throws FormatParseError on failure
    dme::domain::BigMoney parse_big_money(const std::string& text) const;
    // As parse_big_money, then requires the amount to fit the currency scale
    dme::domain::Money parse_money(const std::string& text) const;
    // Runs the parse from start_index and reports the outcome without throwing
    ParseContext parse(const std::string& text, int start_index = 0) const;

    std::string to_string() const;

private:
    Locale locale_;
    std::shared_ptr<const Elements> elements_;
    std::shared_ptr<const dme::repositories::ICurrencyRepository> currencies_;
};

} // namespace dme::format
