#include "domain/value_objects/CurrencyUnit.hpp"

#include <stdexcept>

namespace dme::domain {

namespace {

constexpr int kMaxFractionDigits = 30;

bool is_valid_code(const std::string& code) {
    if (code.size() != 3) return false;
    for (char c : code) {
        if (c < 'A' || c > 'Z') return false;
    }
    return true;
}

} // anonymous namespace

CurrencyUnit::CurrencyUnit(std::string code, int numeric_code, int default_fraction_digits,
                           SymbolTable symbols)
    : code_(std::move(code))
    , numeric_code_(numeric_code)
    , default_fraction_digits_(default_fraction_digits)
    , symbols_(std::make_shared<const SymbolTable>(std::move(symbols))) {
    if (!is_valid_code(code_)) {
        throw std::invalid_argument("Invalid currency code: '" + code_ + "'");
    }
    if (numeric_code_ < -1 || numeric_code_ > 999) {
        throw std::invalid_argument(
            "Invalid numeric code for " + code_ + ": " + std::to_string(numeric_code_));
    }
    if (default_fraction_digits_ < -1 || default_fraction_digits_ > kMaxFractionDigits) {
        throw std::invalid_argument(
            "Invalid decimal places for " + code_ + ": " + std::to_string(default_fraction_digits_));
    }
}

std::string CurrencyUnit::numeric3_code() const {
    if (numeric_code_ < 0) return "";
    auto digits = std::to_string(numeric_code_);
    return std::string(3 - digits.size(), '0') + digits;
}

std::string CurrencyUnit::symbol(const std::string& locale_tag) const {
    auto it = symbols_->find(locale_tag);
    if (it != symbols_->end()) return it->second;

    auto sep = locale_tag.find('_');
    if (sep != std::string::npos) {
        it = symbols_->find(locale_tag.substr(0, sep));
        if (it != symbols_->end()) return it->second;
    }
    return code_;
}

} // namespace dme::domain
