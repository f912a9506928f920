#pragma once

#include "format/AmountStyle.hpp"
#include "format/MoneyPrinter.hpp"
#include "format/ParseContext.hpp"
#include "format/PrintContext.hpp"

#include <memory>
#include <string>
#include <variant>

namespace dme::format {

struct LiteralPrinterParser {
    std::string literal;
};

struct AmountPrinterParser {
    AmountStyle style;
};

struct CurrencyCodePrinterParser {};
struct NumericCodePrinterParser {};
struct Numeric3CodePrinterParser {};
struct LocalizedSymbolPrinterParser {};

// Either side may be null, not both.
struct UserPrinterParser {
    std::shared_ptr<const MoneyPrinter> printer;
    std::shared_ptr<const MoneyParser> parser;
};

using PrinterParser = std::variant<LiteralPrinterParser, AmountPrinterParser,
                                   CurrencyCodePrinterParser, NumericCodePrinterParser,
                                   Numeric3CodePrinterParser, LocalizedSymbolPrinterParser,
                                   UserPrinterParser>;

void print(const PrinterParser& element, const PrintContext& context, std::string& out,
           const dme::domain::BigMoney& money);
void parse(const PrinterParser& element, ParseContext& context);

bool is_printer(const PrinterParser& element);
bool is_parser(const PrinterParser& element);

// Pattern-like description, e.g. "${code}' '${amount}"
std::string describe(const PrinterParser& element);

} // namespace dme::format
