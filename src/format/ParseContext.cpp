#include "format/ParseContext.hpp"

#include "domain/errors/MoneyErrors.hpp"

#include <stdexcept>

using dme::domain::FormatParseError;

namespace dme::format {

ParseContext::ParseContext(Locale locale, std::string text, int index,
                           std::shared_ptr<const dme::repositories::ICurrencyRepository> currencies)
    : locale_(std::move(locale))
    , text_(std::move(text))
    , index_(index)
    , currencies_(std::move(currencies)) {
    if (!currencies_) {
        throw std::invalid_argument("ParseContext requires a currency repository");
    }
    if (index_ < 0 || index_ > text_length()) {
        throw std::out_of_range("Invalid parse start index: " + std::to_string(index));
    }
}

std::string_view ParseContext::text_substring(int start, int end) const {
    return std::string_view(text_).substr(static_cast<size_t>(start), static_cast<size_t>(end - start));
}

void ParseContext::set_index(int index) {
    if (index < 0 || index > text_length()) {
        throw std::out_of_range("Invalid parse index: " + std::to_string(index));
    }
    index_ = index;
}

dme::domain::BigMoney ParseContext::to_big_money() const {
    if (!currency_) {
        throw FormatParseError("Parsing did not find a currency", text_, index_);
    }
    if (!amount_) {
        throw FormatParseError("Parsing did not find an amount", text_, index_);
    }
    return dme::domain::BigMoney(*currency_, *amount_);
}

} // namespace dme::format
