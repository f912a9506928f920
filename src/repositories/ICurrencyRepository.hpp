#pragma once

#include "domain/value_objects/CurrencyUnit.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dme::repositories {

class ICurrencyRepository {
public:
    // Lookups, safe to call concurrently with each other
    virtual std::optional<dme::domain::CurrencyUnit> find_by_code(const std::string& code) const = 0;
    virtual std::optional<dme::domain::CurrencyUnit> find_by_numeric_code(int numeric_code) const = 0;
    virtual std::vector<dme::domain::CurrencyUnit> registered_currencies() const = 0;

    // Throws IllegalCurrencyError when the code is unknown
    dme::domain::CurrencyUnit of(const std::string& code) const;

    virtual void register_currency(const dme::domain::CurrencyUnit& currency) = 0;

    virtual ~ICurrencyRepository() = default;
};

} // namespace dme::repositories
