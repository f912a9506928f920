#pragma once

#include "format/AmountStyle.hpp"
#include "format/MoneyFormatter.hpp"
#include "format/PrinterParsers.hpp"

#include <memory>
#include <string>
#include <vector>

namespace dme::format {

// Collects elements in call order. Not thread-safe; each call to
// to_formatter() takes a snapshot, so the builder can keep being used.
class MoneyFormatterBuilder {
public:
    MoneyFormatterBuilder() = default;

    // Localized grouping when no style is given
    MoneyFormatterBuilder& append_amount();
    MoneyFormatterBuilder& append_amount(const AmountStyle& style);
    MoneyFormatterBuilder& append_currency_code();
    MoneyFormatterBuilder& append_currency_numeric_code();
    MoneyFormatterBuilder& append_currency_numeric3_code();
    MoneyFormatterBuilder& append_currency_symbol_localized();
    // Empty text is ignored
    MoneyFormatterBuilder& append_literal(const std::string& literal);
    MoneyFormatterBuilder& append(PrinterParser element);
    MoneyFormatterBuilder& append(std::shared_ptr<const MoneyPrinter> printer,
                                  std::shared_ptr<const MoneyParser> parser);
    MoneyFormatterBuilder& append(const MoneyFormatter& formatter);

    MoneyFormatter to_formatter() const;
    MoneyFormatter to_formatter(const Locale& locale) const;
    MoneyFormatter to_formatter(const Locale& locale,
                                std::shared_ptr<const dme::repositories::ICurrencyRepository> currencies) const;

    size_t size() const noexcept { return elements_.size(); }

private:
    std::vector<PrinterParser> elements_;
};

} // namespace dme::format
