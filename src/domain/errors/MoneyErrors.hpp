#pragma once

#include "domain/value_objects/CurrencyUnit.hpp"

#include <stdexcept>
#include <string>

namespace dme::domain {

// Thrown when a binary operation or comparison mixes two currencies.
class CurrencyMismatchError : public std::invalid_argument {
public:
    CurrencyMismatchError(const CurrencyUnit& first, const CurrencyUnit& second);

    const CurrencyUnit& first_currency() const noexcept { return first_; }
    const CurrencyUnit& second_currency() const noexcept { return second_; }

private:
    CurrencyUnit first_;
    CurrencyUnit second_;
};

// Thrown when RoundingMode::UNNECESSARY would have to discard non-zero digits.
class UnnecessaryRoundingError : public std::domain_error {
public:
    UnnecessaryRoundingError() : std::domain_error("Rounding necessary") {}
};

class IllegalCurrencyError : public std::invalid_argument {
public:
    explicit IllegalCurrencyError(const std::string& code)
        : std::invalid_argument("Unknown currency '" + code + "'") {}
};

class MoneyFormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class FormatParseError : public MoneyFormatError {
public:
    FormatParseError(const std::string& message, std::string text, int error_index);

    const std::string& text() const noexcept { return text_; }
    int error_index() const noexcept { return error_index_; }

private:
    std::string text_;
    int error_index_;
};

} // namespace dme::domain
