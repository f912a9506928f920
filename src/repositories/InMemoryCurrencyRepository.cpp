#include "repositories/InMemoryCurrencyRepository.hpp"

#include "domain/errors/MoneyErrors.hpp"

#include <stdexcept>

using dme::domain::CurrencyUnit;

namespace dme::repositories {

CurrencyUnit ICurrencyRepository::of(const std::string& code) const {
    auto currency = find_by_code(code);
    if (!currency) {
        throw dme::domain::IllegalCurrencyError(code);
    }
    return *currency;
}

std::optional<CurrencyUnit> InMemoryCurrencyRepository::find_by_code(const std::string& code) const {
    std::lock_guard lock(mutex_);
    auto it = by_code_.find(code);
    if (it != by_code_.end()) return it->second;
    return std::nullopt;
}

std::optional<CurrencyUnit> InMemoryCurrencyRepository::find_by_numeric_code(int numeric_code) const {
    std::lock_guard lock(mutex_);
    auto it = code_by_numeric_.find(numeric_code);
    if (it == code_by_numeric_.end()) return std::nullopt;
    return by_code_.at(it->second);
}

std::vector<CurrencyUnit> InMemoryCurrencyRepository::registered_currencies() const {
    std::lock_guard lock(mutex_);
    std::vector<CurrencyUnit> result;
    result.reserve(by_code_.size());
    for (const auto& [code, currency] : by_code_) {
        result.push_back(currency);
    }
    return result;
}

void InMemoryCurrencyRepository::register_currency(const CurrencyUnit& currency) {
    std::lock_guard lock(mutex_);

    auto existing = by_code_.find(currency.code());
    if (existing != by_code_.end()) {
        const auto& known = existing->second;
        if (known.numeric_code() == currency.numeric_code() &&
            known.default_fraction_digits() == currency.default_fraction_digits()) {
            return;
        }
        throw std::invalid_argument("Currency already registered: " + currency.code());
    }
    if (currency.has_numeric_code()) {
        auto numeric = code_by_numeric_.find(currency.numeric_code());
        if (numeric != code_by_numeric_.end()) {
            throw std::invalid_argument("Numeric code " + currency.numeric3_code() +
                                        " already registered for " + numeric->second);
        }
        code_by_numeric_.emplace(currency.numeric_code(), currency.code());
    }
    by_code_.emplace(currency.code(), currency);
}

size_t InMemoryCurrencyRepository::size() const {
    std::lock_guard lock(mutex_);
    return by_code_.size();
}

} // namespace dme::repositories
