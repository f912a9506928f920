#pragma once

#include "domain/value_objects/BigDecimal.hpp"
#include "domain/value_objects/CurrencyUnit.hpp"
#include "domain/value_objects/RoundingMode.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dme::repositories {
class ICurrencyRepository;
}

namespace dme::domain {

class Money;

// A monetary amount of arbitrary precision and scale.
// Immutable: every operation returns a new value.
class BigMoney {
public:
    BigMoney(CurrencyUnit currency, BigDecimal amount);

    // Factories
    static BigMoney of(const CurrencyUnit& currency, const BigDecimal& amount);
    static BigMoney of_scale(const CurrencyUnit& currency, BigDecimal::Integer unscaled, int32_t scale);
    static BigMoney of_scale(const CurrencyUnit& currency, const BigDecimal& amount, int32_t scale,
                             RoundingMode mode = RoundingMode::UNNECESSARY);
    static BigMoney of_major(const CurrencyUnit& currency, int64_t amount_major);
    static BigMoney of_minor(const CurrencyUnit& currency, int64_t amount_minor);
    static BigMoney zero(const CurrencyUnit& currency);
    static BigMoney zero(const CurrencyUnit& currency, int32_t scale);
    static BigMoney total(const std::vector<BigMoney>& values);
    // Parses the to_string() form, e.g. "USD 12.34"
    static BigMoney parse(const std::string& str, const dme::repositories::ICurrencyRepository& currencies);

    // Queries
    const CurrencyUnit& currency() const noexcept { return currency_; }
    const BigDecimal& amount() const noexcept { return amount_; }
    const BigDecimal::Integer& unscaled_value() const noexcept { return amount_.unscaled_value(); }
    int32_t scale() const noexcept { return amount_.scale(); }
    BigDecimal amount_major() const;
    BigDecimal amount_minor() const;
    // Throws std::out_of_range when the minor part exceeds int
    int minor_part() const;

    bool is_zero() const { return amount_.signum() == 0; }
    bool is_positive() const { return amount_.signum() > 0; }
    bool is_positive_or_zero() const { return amount_.signum() >= 0; }
    bool is_negative() const { return amount_.signum() < 0; }
    bool is_negative_or_zero() const { return amount_.signum() <= 0; }
    bool is_current_scale() const noexcept { return scale() == currency_.decimal_places(); }
    bool is_same_currency(const BigMoney& other) const noexcept { return currency_ == other.currency_; }

    // Rescaling
    BigMoney with_scale(int32_t scale, RoundingMode mode = RoundingMode::UNNECESSARY) const;
    BigMoney with_currency_scale(RoundingMode mode = RoundingMode::UNNECESSARY) const;
    // Rounds to scale without reducing the current scale: USD 12.345 rounded(1) -> USD 12.300.
    // A negative scale rounds left of the point: USD 1234.56 rounded(-1) -> USD 1230.00
    BigMoney rounded(int32_t scale, RoundingMode mode) const;
    BigMoney strip_trailing_zeros() const;
    BigMoney with_currency_unit(const CurrencyUnit& currency) const;
    BigMoney with_amount(const BigDecimal& amount) const;

    // Addition and subtraction are always exact, scale is the wider of the two
    BigMoney plus(const BigMoney& other) const;
    BigMoney plus(const BigDecimal& amount) const;
    BigMoney plus_major(int64_t amount) const;
    BigMoney plus_minor(int64_t amount) const;
    BigMoney minus(const BigMoney& other) const;
    BigMoney minus(const BigDecimal& amount) const;
    BigMoney minus_major(int64_t amount) const;
    BigMoney minus_minor(int64_t amount) const;

    // Exact product, scale grows by the factor's scale
    BigMoney multiplied_by(const BigDecimal& factor) const;
    BigMoney multiplied_by(int64_t factor) const;
    // Product rounded back to the current scale
    BigMoney multiplied_by(const BigDecimal& factor, RoundingMode mode) const;
    // Quotient at the current scale
    BigMoney divided_by(const BigDecimal& divisor, RoundingMode mode) const;
    BigMoney divided_by(int64_t divisor, RoundingMode mode) const;

    BigMoney negated() const;
    BigMoney abs() const;

    // Conversion rate must be positive and the currency must differ
    BigMoney converted_to(const CurrencyUnit& currency, const BigDecimal& rate) const;
    BigMoney converted_to(const CurrencyUnit& currency, const BigDecimal& rate, RoundingMode mode) const;

    // Comparison requires the same currency, scales are aligned without loss
    int compare_to(const BigMoney& other) const;
    bool is_equal(const BigMoney& other) const { return compare_to(other) == 0; }
    bool is_greater_than(const BigMoney& other) const { return compare_to(other) > 0; }
    bool is_less_than(const BigMoney& other) const { return compare_to(other) < 0; }

    Money to_money(RoundingMode mode = RoundingMode::UNNECESSARY) const;
    std::string to_string() const;

    // Structural: USD 1.0 != USD 1.00
    bool operator==(const BigMoney& other) const;

private:
    void check_currency_equal(const BigMoney& other) const;

    CurrencyUnit currency_;
    BigDecimal amount_;
};

} // namespace dme::domain
