#include "format/MoneyFormatterBuilder.hpp"

#include "infrastructure/CurrencyDataLoader.hpp"

#include <stdexcept>

namespace dme::format {

MoneyFormatterBuilder& MoneyFormatterBuilder::append_amount() {
    return append(AmountPrinterParser{AmountStyle::localized_grouping()});
}

MoneyFormatterBuilder& MoneyFormatterBuilder::append_amount(const AmountStyle& style) {
    return append(AmountPrinterParser{style});
}

MoneyFormatterBuilder& MoneyFormatterBuilder::append_currency_code() {
    return append(CurrencyCodePrinterParser{});
}

MoneyFormatterBuilder& MoneyFormatterBuilder::append_currency_numeric_code() {
    return append(NumericCodePrinterParser{});
}

MoneyFormatterBuilder& MoneyFormatterBuilder::append_currency_numeric3_code() {
    return append(Numeric3CodePrinterParser{});
}

MoneyFormatterBuilder& MoneyFormatterBuilder::append_currency_symbol_localized() {
    return append(LocalizedSymbolPrinterParser{});
}

MoneyFormatterBuilder& MoneyFormatterBuilder::append_literal(const std::string& literal) {
    if (literal.empty()) {
        return *this;
    }
    return append(LiteralPrinterParser{literal});
}

MoneyFormatterBuilder& MoneyFormatterBuilder::append(PrinterParser element) {
    elements_.push_back(std::move(element));
    return *this;
}

MoneyFormatterBuilder& MoneyFormatterBuilder::append(std::shared_ptr<const MoneyPrinter> printer,
                                                     std::shared_ptr<const MoneyParser> parser) {
    if (!printer && !parser) {
        throw std::invalid_argument("MoneyPrinter and MoneyParser must not both be null");
    }
    return append(UserPrinterParser{std::move(printer), std::move(parser)});
}

MoneyFormatterBuilder& MoneyFormatterBuilder::append(const MoneyFormatter& formatter) {
    elements_.insert(elements_.end(), formatter.elements().begin(), formatter.elements().end());
    return *this;
}

MoneyFormatter MoneyFormatterBuilder::to_formatter() const {
    return to_formatter(Locale::us());
}

MoneyFormatter MoneyFormatterBuilder::to_formatter(const Locale& locale) const {
    return to_formatter(locale, dme::infrastructure::default_currencies());
}

MoneyFormatter MoneyFormatterBuilder::to_formatter(
    const Locale& locale,
    std::shared_ptr<const dme::repositories::ICurrencyRepository> currencies) const {
    auto snapshot = std::make_shared<const std::vector<PrinterParser>>(elements_);
    return MoneyFormatter(locale, std::move(snapshot), std::move(currencies));
}

} // namespace dme::format
