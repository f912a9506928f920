#pragma once

#include "repositories/ICurrencyRepository.hpp"

#include <map>
#include <mutex>

namespace dme::repositories {

class InMemoryCurrencyRepository : public dme::repositories::ICurrencyRepository {
public:
    std::optional<dme::domain::CurrencyUnit> find_by_code(const std::string& code) const override;
    std::optional<dme::domain::CurrencyUnit> find_by_numeric_code(int numeric_code) const override;
    std::vector<dme::domain::CurrencyUnit> registered_currencies() const override;

    // Re-registering an identical currency is a no-op; a conflicting code or
    // numeric code throws std::invalid_argument.
    void register_currency(const dme::domain::CurrencyUnit& currency) override;

    size_t size() const;

private:
    std::map<std::string, dme::domain::CurrencyUnit> by_code_;
    std::map<int, std::string> code_by_numeric_;
    mutable std::mutex mutex_;
};

} // namespace dme::repositories
