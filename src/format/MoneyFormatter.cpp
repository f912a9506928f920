#include "format/MoneyFormatter.hpp"

#include "domain/errors/MoneyErrors.hpp"

#include <algorithm>
#include <stdexcept>

using dme::domain::BigMoney;
using dme::domain::FormatParseError;
using dme::domain::Money;
using dme::domain::MoneyFormatError;

namespace dme::format {

MoneyFormatter::MoneyFormatter(Locale locale, std::shared_ptr<const Elements> elements,
                               std::shared_ptr<const dme::repositories::ICurrencyRepository> currencies)
    : locale_(std::move(locale))
    , elements_(std::move(elements))
    , currencies_(std::move(currencies)) {
    if (!elements_) {
        throw std::invalid_argument("MoneyFormatter elements must not be null");
    }
    if (!currencies_) {
        throw std::invalid_argument("MoneyFormatter currency repository must not be null");
    }
}

MoneyFormatter MoneyFormatter::with_locale(Locale locale) const {
    return MoneyFormatter(std::move(locale), elements_, currencies_);
}

MoneyFormatter MoneyFormatter::with_currencies(
    std::shared_ptr<const dme::repositories::ICurrencyRepository> currencies) const {
    return MoneyFormatter(locale_, elements_, std::move(currencies));
}

bool MoneyFormatter::is_print_supported() const {
    return std::all_of(elements_->begin(), elements_->end(),
                       [](const PrinterParser& e) { return is_printer(e); });
}

bool MoneyFormatter::is_parse_supported() const {
    return std::all_of(elements_->begin(), elements_->end(),
                       [](const PrinterParser& e) { return is_parser(e); });
}

std::string MoneyFormatter::print(const BigMoney& money) const {
    std::string out;
    print_to(out, money);
    return out;
}

std::string MoneyFormatter::print(const Money& money) const {
    return print(money.to_big_money());
}

void MoneyFormatter::print_to(std::string& out, const BigMoney& money) const {
    if (!is_print_supported()) {
        throw MoneyFormatError("MoneyFormatter has not been configured to be able to print");
    }
    PrintContext context(locale_);
    for (const auto& element : *elements_) {
        dme::format::print(element, context, out, money);
    }
}

ParseContext MoneyFormatter::parse(const std::string& text, int start_index) const {
    if (!is_parse_supported()) {
        throw MoneyFormatError("MoneyFormatter has not been configured to be able to parse");
    }
    ParseContext context(locale_, text, start_index, currencies_);
    for (const auto& element : *elements_) {
        dme::format::parse(element, context);
        if (context.is_error()) break;
    }
    return context;
}

BigMoney MoneyFormatter::parse_big_money(const std::string& text) const {
    auto context = parse(text, 0);
    if (context.is_error()) {
        throw FormatParseError("Text could not be parsed at index " +
                               std::to_string(context.error_index()),
                               text, context.error_index());
    }
    if (!context.is_fully_parsed()) {
        throw FormatParseError("Unparsed text found at index " + std::to_string(context.index()),
                               text, context.index());
    }
    return context.to_big_money();
}

Money MoneyFormatter::parse_money(const std::string& text) const {
    return Money::of(parse_big_money(text));
}

std::string MoneyFormatter::to_string() const {
    std::string result;
    for (const auto& element : *elements_) {
        result += describe(element);
    }
    return result;
}

} // namespace dme::format
