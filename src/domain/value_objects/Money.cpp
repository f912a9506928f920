#include "domain/value_objects/Money.hpp"

#include <stdexcept>

namespace dme::domain {

Money::Money(BigMoney money) : money_(std::move(money)) {
    if (!money_.is_current_scale()) {
        throw std::invalid_argument(
            "Money scale must match the currency decimal places: " + money_.to_string());
    }
}

Money Money::of(const CurrencyUnit& currency, const BigDecimal& amount, RoundingMode mode) {
    return Money(BigMoney(currency, amount.with_scale(currency.decimal_places(), mode)));
}

Money Money::of(const BigMoney& money, RoundingMode mode) {
    return Money(money.with_currency_scale(mode));
}

Money Money::of_major(const CurrencyUnit& currency, int64_t amount_major) {
    return of(currency, BigDecimal::of(amount_major));
}

Money Money::of_minor(const CurrencyUnit& currency, int64_t amount_minor) {
    return Money(BigMoney::of_minor(currency, amount_minor));
}

Money Money::zero(const CurrencyUnit& currency) {
    return Money(BigMoney::zero(currency, currency.decimal_places()));
}

Money Money::total(const std::vector<Money>& values) {
    if (values.empty()) {
        throw std::invalid_argument("Money total requires at least one value");
    }
    Money result = values.front();
    for (size_t i = 1; i < values.size(); ++i) {
        result = result.plus(values[i]);
    }
    return result;
}

Money Money::parse(const std::string& str, const dme::repositories::ICurrencyRepository& currencies) {
    return of(BigMoney::parse(str, currencies));
}

Money Money::with(const BigMoney& result, RoundingMode mode) const {
    return Money(result.with_currency_scale(mode));
}

Money Money::with_currency_unit(const CurrencyUnit& currency, RoundingMode mode) const {
    return with(money_.with_currency_unit(currency), mode);
}

Money Money::with_amount(const BigDecimal& amount, RoundingMode mode) const {
    return with(money_.with_amount(amount), mode);
}

Money Money::with_currency_scale(RoundingMode) const {
    return *this;
}

Money Money::rounded(int32_t scale, RoundingMode mode) const {
    return Money(money_.rounded(scale, mode));
}

Money Money::plus(const Money& other) const {
    return Money(money_.plus(other.money_));
}

Money Money::plus(const BigMoney& other, RoundingMode mode) const {
    return with(money_.plus(other), mode);
}

Money Money::plus(const BigDecimal& amount, RoundingMode mode) const {
    return with(money_.plus(amount), mode);
}

Money Money::plus_major(int64_t amount) const {
    return Money(money_.plus_major(amount));
}

Money Money::plus_minor(int64_t amount) const {
    return Money(money_.plus_minor(amount));
}

Money Money::minus(const Money& other) const {
    return Money(money_.minus(other.money_));
}

Money Money::minus(const BigMoney& other, RoundingMode mode) const {
    return with(money_.minus(other), mode);
}

Money Money::minus(const BigDecimal& amount, RoundingMode mode) const {
    return with(money_.minus(amount), mode);
}

Money Money::minus_major(int64_t amount) const {
    return Money(money_.minus_major(amount));
}

Money Money::minus_minor(int64_t amount) const {
    return Money(money_.minus_minor(amount));
}

Money Money::multiplied_by(const BigDecimal& factor, RoundingMode mode) const {
    return Money(money_.multiplied_by(factor, mode));
}

Money Money::multiplied_by(int64_t factor) const {
    return Money(money_.multiplied_by(factor));
}

Money Money::divided_by(const BigDecimal& divisor, RoundingMode mode) const {
    return Money(money_.divided_by(divisor, mode));
}

Money Money::divided_by(int64_t divisor, RoundingMode mode) const {
    return Money(money_.divided_by(divisor, mode));
}

Money Money::negated() const {
    return Money(money_.negated());
}

Money Money::abs() const {
    return is_negative() ? negated() : *this;
}

Money Money::converted_to(const CurrencyUnit& currency, const BigDecimal& rate, RoundingMode mode) const {
    return with(money_.converted_to(currency, rate), mode);
}

} // namespace dme::domain
