#include "infrastructure/MoneyJsonCodec.hpp"

#include <stdexcept>

using json = nlohmann::json;
using namespace dme::domain;

namespace dme::infrastructure {

json MoneyJsonCodec::encode(const BigMoney& money) const {
    return json{
        {"currency", money.currency().code()},
        {"unscaled", money.unscaled_value().str()},
        {"scale", money.scale()},
    };
}

json MoneyJsonCodec::encode(const Money& money) const {
    return encode(money.to_big_money());
}

BigMoney MoneyJsonCodec::decode_big_money(const json& obj) const {
    if (!obj.is_object()) {
        throw std::invalid_argument("Money JSON must be an object");
    }
    if (!obj.contains("currency") || !obj["currency"].is_string()) {
        throw std::invalid_argument("Money JSON requires a string 'currency'");
    }
    if (!obj.contains("unscaled") || !obj["unscaled"].is_string()) {
        throw std::invalid_argument("Money JSON requires a string 'unscaled'");
    }
    if (!obj.contains("scale") || !obj["scale"].is_number_integer()) {
        throw std::invalid_argument("Money JSON requires an integer 'scale'");
    }

    auto currency = currencies_.of(obj["currency"].get<std::string>());
    // Reuse the decimal parser so that only plain integers are accepted
    auto unscaled = BigDecimal::from_string(obj["unscaled"].get<std::string>());
    if (unscaled.scale() != 0) {
        throw std::invalid_argument("Money JSON 'unscaled' must be an integer");
    }
    return BigMoney::of_scale(currency, unscaled.unscaled_value(), obj["scale"].get<int32_t>());
}

Money MoneyJsonCodec::decode_money(const json& obj) const {
    return Money::of(decode_big_money(obj));
}

} // namespace dme::infrastructure
