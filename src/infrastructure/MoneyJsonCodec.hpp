#pragma once

#include "domain/value_objects/BigMoney.hpp"
#include "domain/value_objects/Money.hpp"
#include "repositories/ICurrencyRepository.hpp"

#include <nlohmann/json.hpp>

namespace dme::infrastructure {

// Encodes amounts as {"currency": "USD", "unscaled": "1234", "scale": 2}.
// The unscaled value is a string so that it keeps its full precision.
class MoneyJsonCodec {
public:
    explicit MoneyJsonCodec(const dme::repositories::ICurrencyRepository& currencies)
        : currencies_(currencies) {}

    nlohmann::json encode(const dme::domain::BigMoney& money) const;
    nlohmann::json encode(const dme::domain::Money& money) const;

    // Throws std::invalid_argument on malformed documents and
    // IllegalCurrencyError for unknown currencies
    dme::domain::BigMoney decode_big_money(const nlohmann::json& obj) const;
    dme::domain::Money decode_money(const nlohmann::json& obj) const;

private:
    const dme::repositories::ICurrencyRepository& currencies_;
};

} // namespace dme::infrastructure
