#include "format/PrinterParsers.hpp"

#include "domain/errors/MoneyErrors.hpp"

#include <string_view>

using dme::domain::BigDecimal;
using dme::domain::BigMoney;
using dme::domain::MoneyFormatError;

namespace dme::format {

namespace {

bool is_ascii_upper(char c) {
    return c >= 'A' && c <= 'Z';
}

bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

// --- Literal ---

void print_element(const LiteralPrinterParser& element, const PrintContext&, std::string& out,
                   const BigMoney&) {
    out += element.literal;
}

void parse_element(const LiteralPrinterParser& element, ParseContext& context) {
    int end = context.index() + static_cast<int>(element.literal.size());
    if (end <= context.text_length() &&
        context.text_substring(context.index(), end) == element.literal) {
        context.set_index(end);
    } else {
        context.set_error();
    }
}

// --- Amount ---

void print_element(const AmountPrinterParser& element, const PrintContext& context, std::string& out,
                   const BigMoney& money) {
    // Resolved per call; the element itself is never updated
    const AmountStyle style = element.style.localize(context.locale());
    const char zero = *style.zero_character();
    const char decimal_point = *style.decimal_point_character();
    const char grouping_char = *style.grouping_character();
    const size_t grouping_size = static_cast<size_t>(*style.grouping_size());

    const std::string str = money.amount().abs().to_plain_string();
    const auto dec_pos = str.find('.');
    const std::string_view integer_part =
        std::string_view(str).substr(0, dec_pos == std::string::npos ? str.size() : dec_pos);

    auto digit = [zero](char c) { return static_cast<char>(zero + (c - '0')); };

    if (money.is_negative()) {
        out += '-';
    }

    // A separator precedes every digit whose remaining integer digit count
    // (itself included) is a multiple of the grouping size.
    const size_t length = integer_part.size();
    for (size_t i = 0; i < length; ++i) {
        if (style.is_grouping() && i > 0 && (length - i) % grouping_size == 0) {
            out += grouping_char;
        }
        out += digit(integer_part[i]);
    }

    if (dec_pos != std::string::npos) {
        out += decimal_point;
        for (size_t i = dec_pos + 1; i < str.size(); ++i) {
            out += digit(str[i]);
        }
    } else if (style.is_forced_decimal_point()) {
        out += decimal_point;
    }
}

void parse_element(const AmountPrinterParser& element, ParseContext& context) {
    const AmountStyle style = element.style.localize(context.locale());
    const int zero = static_cast<unsigned char>(*style.zero_character());
    const char decimal_point = *style.decimal_point_character();
    const char grouping_char = *style.grouping_character();

    const std::string& text = context.text();
    const int length = context.text_length();
    int pos = context.index();

    bool negative = false;
    if (pos < length && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    std::string digits;
    int32_t scale = 0;
    bool decimal_point_seen = false;
    bool last_was_group = false;
    for (; pos < length; ++pos) {
        const int c = static_cast<unsigned char>(text[pos]);
        if (c >= zero && c < zero + 10) {
            digits += static_cast<char>('0' + (c - zero));
            if (decimal_point_seen) ++scale;
            last_was_group = false;
        } else if (text[pos] == decimal_point && !decimal_point_seen) {
            decimal_point_seen = true;
            last_was_group = false;
        } else if (text[pos] == grouping_char && !last_was_group) {
            // Skipped wherever it appears, whether or not grouping is on
            last_was_group = true;
        } else {
            break;
        }
    }
    // A trailing separator belongs to whatever follows the amount
    if (last_was_group) {
        --pos;
    }

    if (digits.empty()) {
        context.set_error();
        return;
    }

    BigDecimal::Integer unscaled(digits);
    if (negative) {
        unscaled = -unscaled;
    }
    context.set_amount(BigDecimal(std::move(unscaled), scale));
    context.set_index(pos);
}

// --- Currency code ---

void print_element(const CurrencyCodePrinterParser&, const PrintContext&, std::string& out,
                   const BigMoney& money) {
    out += money.currency().code();
}

void parse_element(const CurrencyCodePrinterParser&, ParseContext& context) {
    const int start = context.index();
    for (int pos = start; pos < start + 3; ++pos) {
        if (pos >= context.text_length() || !is_ascii_upper(context.text()[pos])) {
            context.set_error_index(pos);
            return;
        }
    }
    auto currency = context.currencies().find_by_code(std::string(context.text_substring(start, start + 3)));
    if (!currency) {
        context.set_error();
        return;
    }
    context.set_currency(*currency);
    context.set_index(start + 3);
}

// --- Numeric codes ---

// Consumes between min_digits and 3 digits and resolves them to a currency.
void parse_numeric_code(ParseContext& context, int min_digits) {
    const int start = context.index();
    int pos = start;
    while (pos < context.text_length() && pos < start + 3 && is_ascii_digit(context.text()[pos])) {
        ++pos;
    }
    if (pos - start < min_digits) {
        context.set_error_index(pos);
        return;
    }
    int numeric_code = std::stoi(std::string(context.text_substring(start, pos)));
    auto currency = context.currencies().find_by_numeric_code(numeric_code);
    if (!currency) {
        context.set_error();
        return;
    }
    context.set_currency(*currency);
    context.set_index(pos);
}

void print_element(const NumericCodePrinterParser&, const PrintContext&, std::string& out,
                   const BigMoney& money) {
    if (money.currency().has_numeric_code()) {
        out += std::to_string(money.currency().numeric_code());
    }
}

void parse_element(const NumericCodePrinterParser&, ParseContext& context) {
    parse_numeric_code(context, 1);
}

void print_element(const Numeric3CodePrinterParser&, const PrintContext&, std::string& out,
                   const BigMoney& money) {
    out += money.currency().numeric3_code();
}

void parse_element(const Numeric3CodePrinterParser&, ParseContext& context) {
    parse_numeric_code(context, 3);
}

// --- Localized symbol ---

void print_element(const LocalizedSymbolPrinterParser&, const PrintContext& context, std::string& out,
                   const BigMoney& money) {
    out += money.currency().symbol(context.locale().tag());
}

// Symbols are ambiguous across currencies, so they cannot identify one
void parse_element(const LocalizedSymbolPrinterParser&, ParseContext& context) {
    context.set_error();
}

// --- User supplied ---

void print_element(const UserPrinterParser& element, const PrintContext& context, std::string& out,
                   const BigMoney& money) {
    if (!element.printer) {
        throw MoneyFormatError("Element does not support printing: " + describe(element));
    }
    element.printer->print(context, out, money);
}

void parse_element(const UserPrinterParser& element, ParseContext& context) {
    if (!element.parser) {
        throw MoneyFormatError("Element does not support parsing: " + describe(element));
    }
    element.parser->parse(context);
}

} // anonymous namespace

void print(const PrinterParser& element, const PrintContext& context, std::string& out,
           const BigMoney& money) {
    std::visit([&](const auto& e) { print_element(e, context, out, money); }, element);
}

void parse(const PrinterParser& element, ParseContext& context) {
    std::visit([&](const auto& e) { parse_element(e, context); }, element);
}

bool is_printer(const PrinterParser& element) {
    if (const auto* user = std::get_if<UserPrinterParser>(&element)) {
        return user->printer != nullptr;
    }
    return true;
}

bool is_parser(const PrinterParser& element) {
    if (const auto* user = std::get_if<UserPrinterParser>(&element)) {
        return user->parser != nullptr;
    }
    return !std::holds_alternative<LocalizedSymbolPrinterParser>(element);
}

std::string describe(const PrinterParser& element) {
    struct Describer {
        std::string operator()(const LiteralPrinterParser& e) const { return "'" + e.literal + "'"; }
        std::string operator()(const AmountPrinterParser&) const { return "${amount}"; }
        std::string operator()(const CurrencyCodePrinterParser&) const { return "${code}"; }
        std::string operator()(const NumericCodePrinterParser&) const { return "${numericCode}"; }
        std::string operator()(const Numeric3CodePrinterParser&) const { return "${numeric3Code}"; }
        std::string operator()(const LocalizedSymbolPrinterParser&) const { return "${symbolLocalized}"; }
        std::string operator()(const UserPrinterParser& e) const {
            return e.printer ? e.printer->describe() : "${user}";
        }
    };
    return std::visit(Describer{}, element);
}

} // namespace dme::format
