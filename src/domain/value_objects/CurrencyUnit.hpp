#pragma once

#include <compare>
#include <map>
#include <memory>
#include <string>

namespace dme::domain {

class CurrencyUnit {
public:
    using SymbolTable = std::map<std::string, std::string>;

    // numeric_code of -1 means the currency has no ISO numeric code.
    // default_fraction_digits of -1 marks a pseudo currency such as XAU.
    CurrencyUnit(std::string code, int numeric_code, int default_fraction_digits,
                 SymbolTable symbols = {});

    const std::string& code() const noexcept { return code_; }
    int numeric_code() const noexcept { return numeric_code_; }
    int default_fraction_digits() const noexcept { return default_fraction_digits_; }
    const SymbolTable& symbols() const noexcept { return *symbols_; }

    // Scale used by Money; pseudo currencies use 0.
    int decimal_places() const noexcept {
        return default_fraction_digits_ < 0 ? 0 : default_fraction_digits_;
    }
    bool is_pseudo_currency() const noexcept { return default_fraction_digits_ < 0; }
    bool has_numeric_code() const noexcept { return numeric_code_ >= 0; }

    // Zero padded to three digits, empty when there is no numeric code.
    std::string numeric3_code() const;

    // Looks up the full locale tag, then its language, then falls back to the code.
    std::string symbol(const std::string& locale_tag) const;

    bool operator==(const CurrencyUnit& other) const noexcept { return code_ == other.code_; }
    std::strong_ordering operator<=>(const CurrencyUnit& other) const noexcept {
        return code_ <=> other.code_;
    }

private:
    std::string code_;
    int numeric_code_;
    int default_fraction_digits_;
    // Shared so that copying a currency through arithmetic stays cheap.
    std::shared_ptr<const SymbolTable> symbols_;
};

} // namespace dme::domain
