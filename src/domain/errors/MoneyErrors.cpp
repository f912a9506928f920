#include "domain/errors/MoneyErrors.hpp"

namespace dme::domain {

CurrencyMismatchError::CurrencyMismatchError(const CurrencyUnit& first, const CurrencyUnit& second)
    : std::invalid_argument("Currencies differ: " + first.code() + "/" + second.code())
    , first_(first)
    , second_(second) {}

FormatParseError::FormatParseError(const std::string& message, std::string text, int error_index)
    : MoneyFormatError(message + ": " + text)
    , text_(std::move(text))
    , error_index_(error_index) {}

} // namespace dme::domain
