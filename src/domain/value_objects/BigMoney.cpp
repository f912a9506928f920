#include "domain/value_objects/BigMoney.hpp"

#include "domain/errors/MoneyErrors.hpp"
#include "domain/value_objects/Money.hpp"
#include "repositories/ICurrencyRepository.hpp"

#include <limits>
#include <stdexcept>

namespace dme::domain {

BigMoney::BigMoney(CurrencyUnit currency, BigDecimal amount)
    : currency_(std::move(currency))
    , amount_(std::move(amount)) {}

BigMoney BigMoney::of(const CurrencyUnit& currency, const BigDecimal& amount) {
    return BigMoney(currency, amount);
}

BigMoney BigMoney::of_scale(const CurrencyUnit& currency, BigDecimal::Integer unscaled, int32_t scale) {
    return BigMoney(currency, BigDecimal(std::move(unscaled), scale));
}

BigMoney BigMoney::of_scale(const CurrencyUnit& currency, const BigDecimal& amount, int32_t scale,
                            RoundingMode mode) {
    return BigMoney(currency, amount.with_scale(scale, mode));
}

BigMoney BigMoney::of_major(const CurrencyUnit& currency, int64_t amount_major) {
    return BigMoney(currency, BigDecimal::of(amount_major));
}

BigMoney BigMoney::of_minor(const CurrencyUnit& currency, int64_t amount_minor) {
    return BigMoney(currency, BigDecimal(BigDecimal::Integer(amount_minor), currency.decimal_places()));
}

BigMoney BigMoney::zero(const CurrencyUnit& currency) {
    return BigMoney(currency, BigDecimal());
}

BigMoney BigMoney::zero(const CurrencyUnit& currency, int32_t scale) {
    return BigMoney(currency, BigDecimal(0, scale));
}

BigMoney BigMoney::total(const std::vector<BigMoney>& values) {
    if (values.empty()) {
        throw std::invalid_argument("Money total requires at least one value");
    }
    BigMoney result = values.front();
    for (size_t i = 1; i < values.size(); ++i) {
        result = result.plus(values[i]);
    }
    return result;
}

BigMoney BigMoney::parse(const std::string& str, const dme::repositories::ICurrencyRepository& currencies) {
    if (str.size() < 4) {
        throw std::invalid_argument("Money '" + str + "' cannot be parsed");
    }
    auto currency = currencies.of(str.substr(0, 3));
    size_t amount_start = 3;
    while (amount_start < str.size() && str[amount_start] == ' ') {
        ++amount_start;
    }
    return BigMoney(currency, BigDecimal::from_string(str.substr(amount_start)));
}

BigDecimal BigMoney::amount_major() const {
    return amount_.with_scale(0, RoundingMode::DOWN);
}

BigDecimal BigMoney::amount_minor() const {
    auto minor = amount_.with_scale(currency_.decimal_places(), RoundingMode::DOWN);
    return BigDecimal(minor.unscaled_value(), 0);
}

int BigMoney::minor_part() const {
    const BigDecimal::Integer minor = amount_minor().unscaled_value();
    const BigDecimal::Integer part = minor % BigDecimal::ten_pow(currency_.decimal_places());
    if (part > std::numeric_limits<int>::max() || part < std::numeric_limits<int>::min()) {
        throw std::out_of_range("Minor part does not fit in an int: " + part.str());
    }
    return part.convert_to<int>();
}

BigMoney BigMoney::with_scale(int32_t scale, RoundingMode mode) const {
    if (scale == this->scale()) return *this;
    return BigMoney(currency_, amount_.with_scale(scale, mode));
}

BigMoney BigMoney::with_currency_scale(RoundingMode mode) const {
    return with_scale(currency_.decimal_places(), mode);
}

BigMoney BigMoney::rounded(int32_t scale, RoundingMode mode) const {
    if (scale >= this->scale()) return *this;
    // scale may be negative, rounding to tens, hundreds and so on
    const BigDecimal::Integer factor = BigDecimal::ten_pow(this->scale() - scale);
    const BigDecimal::Integer quotient = divide_and_round(amount_.unscaled_value(), factor, mode);
    return BigMoney(currency_, BigDecimal(quotient * factor, this->scale()));
}

BigMoney BigMoney::strip_trailing_zeros() const {
    return BigMoney(currency_, amount_.strip_trailing_zeros());
}

BigMoney BigMoney::with_currency_unit(const CurrencyUnit& currency) const {
    return BigMoney(currency, amount_);
}

BigMoney BigMoney::with_amount(const BigDecimal& amount) const {
    return BigMoney(currency_, amount);
}

BigMoney BigMoney::plus(const BigMoney& other) const {
    check_currency_equal(other);
    return plus(other.amount_);
}

BigMoney BigMoney::plus(const BigDecimal& amount) const {
    if (amount.is_zero() && amount.scale() <= scale()) return *this;
    return BigMoney(currency_, amount_.plus(amount));
}

BigMoney BigMoney::plus_major(int64_t amount) const {
    return plus(BigDecimal::of(amount));
}

BigMoney BigMoney::plus_minor(int64_t amount) const {
    return plus(BigDecimal(BigDecimal::Integer(amount), currency_.decimal_places()));
}

BigMoney BigMoney::minus(const BigMoney& other) const {
    check_currency_equal(other);
    return minus(other.amount_);
}

BigMoney BigMoney::minus(const BigDecimal& amount) const {
    return plus(amount.negated());
}

BigMoney BigMoney::minus_major(int64_t amount) const {
    return plus_major(-amount);
}

BigMoney BigMoney::minus_minor(int64_t amount) const {
    return plus_minor(-amount);
}

BigMoney BigMoney::multiplied_by(const BigDecimal& factor) const {
    return BigMoney(currency_, amount_.multiplied_by(factor));
}

BigMoney BigMoney::multiplied_by(int64_t factor) const {
    return multiplied_by(BigDecimal::of(factor));
}

BigMoney BigMoney::multiplied_by(const BigDecimal& factor, RoundingMode mode) const {
    return BigMoney(currency_, amount_.multiplied_by(factor).with_scale(scale(), mode));
}

BigMoney BigMoney::divided_by(const BigDecimal& divisor, RoundingMode mode) const {
    return BigMoney(currency_, amount_.divided_by(divisor, scale(), mode));
}

BigMoney BigMoney::divided_by(int64_t divisor, RoundingMode mode) const {
    return divided_by(BigDecimal::of(divisor), mode);
}

BigMoney BigMoney::negated() const {
    return BigMoney(currency_, amount_.negated());
}

BigMoney BigMoney::abs() const {
    return is_negative() ? negated() : *this;
}

namespace {

void check_conversion(const CurrencyUnit& from, const CurrencyUnit& to, const BigDecimal& rate) {
    if (from == to) {
        throw std::invalid_argument("Cannot convert to the same currency: " + to.code());
    }
    if (rate.signum() <= 0) {
        throw std::invalid_argument("Conversion rate must be positive, got: " + rate.to_plain_string());
    }
}

} // anonymous namespace

BigMoney BigMoney::converted_to(const CurrencyUnit& currency, const BigDecimal& rate) const {
    check_conversion(currency_, currency, rate);
    return BigMoney(currency, amount_.multiplied_by(rate));
}

BigMoney BigMoney::converted_to(const CurrencyUnit& currency, const BigDecimal& rate,
                                RoundingMode mode) const {
    check_conversion(currency_, currency, rate);
    return BigMoney(currency, amount_.multiplied_by(rate).with_scale(scale(), mode));
}

int BigMoney::compare_to(const BigMoney& other) const {
    check_currency_equal(other);
    auto cmp = amount_ <=> other.amount_;
    if (cmp < 0) return -1;
    if (cmp > 0) return 1;
    return 0;
}

Money BigMoney::to_money(RoundingMode mode) const {
    return Money::of(*this, mode);
}

std::string BigMoney::to_string() const {
    return currency_.code() + " " + amount_.to_plain_string();
}

bool BigMoney::operator==(const BigMoney& other) const {
    return currency_ == other.currency_ &&
           scale() == other.scale() &&
           unscaled_value() == other.unscaled_value();
}

void BigMoney::check_currency_equal(const BigMoney& other) const {
    if (!is_same_currency(other)) {
        throw CurrencyMismatchError(currency_, other.currency_);
    }
}

} // namespace dme::domain
