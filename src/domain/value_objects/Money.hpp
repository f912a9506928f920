#pragma once

#include "domain/value_objects/BigMoney.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dme::domain {

// A monetary amount held at exactly the currency's decimal places.
// Any result that would change the scale is rounded back with the given
// mode; the default UNNECESSARY fails only if digits would really be lost.
class Money {
public:
    // Factories
    static Money of(const CurrencyUnit& currency, const BigDecimal& amount,
                    RoundingMode mode = RoundingMode::UNNECESSARY);
    static Money of(const BigMoney& money, RoundingMode mode = RoundingMode::UNNECESSARY);
    static Money of_major(const CurrencyUnit& currency, int64_t amount_major);
    static Money of_minor(const CurrencyUnit& currency, int64_t amount_minor);
    static Money zero(const CurrencyUnit& currency);
    static Money total(const std::vector<Money>& values);
    static Money parse(const std::string& str, const dme::repositories::ICurrencyRepository& currencies);

    // Queries
    const CurrencyUnit& currency() const noexcept { return money_.currency(); }
    const BigDecimal& amount() const noexcept { return money_.amount(); }
    int32_t scale() const noexcept { return money_.scale(); }
    BigDecimal amount_major() const { return money_.amount_major(); }
    BigDecimal amount_minor() const { return money_.amount_minor(); }
    int minor_part() const { return money_.minor_part(); }

    bool is_zero() const { return money_.is_zero(); }
    bool is_positive() const { return money_.is_positive(); }
    bool is_positive_or_zero() const { return money_.is_positive_or_zero(); }
    bool is_negative() const { return money_.is_negative(); }
    bool is_negative_or_zero() const { return money_.is_negative_or_zero(); }
    bool is_same_currency(const Money& other) const noexcept { return money_.is_same_currency(other.money_); }

    Money with_currency_unit(const CurrencyUnit& currency, RoundingMode mode = RoundingMode::UNNECESSARY) const;
    Money with_amount(const BigDecimal& amount, RoundingMode mode = RoundingMode::UNNECESSARY) const;
    // Already at the currency scale, so this returns an identical value
    Money with_currency_scale(RoundingMode mode = RoundingMode::UNNECESSARY) const;
    Money rounded(int32_t scale, RoundingMode mode) const;

    Money plus(const Money& other) const;
    Money plus(const BigMoney& other, RoundingMode mode = RoundingMode::UNNECESSARY) const;
    Money plus(const BigDecimal& amount, RoundingMode mode = RoundingMode::UNNECESSARY) const;
    Money plus_major(int64_t amount) const;
    Money plus_minor(int64_t amount) const;
    Money minus(const Money& other) const;
    Money minus(const BigMoney& other, RoundingMode mode = RoundingMode::UNNECESSARY) const;
    Money minus(const BigDecimal& amount, RoundingMode mode = RoundingMode::UNNECESSARY) const;
    Money minus_major(int64_t amount) const;
    Money minus_minor(int64_t amount) const;

    Money multiplied_by(const BigDecimal& factor, RoundingMode mode = RoundingMode::UNNECESSARY) const;
    Money multiplied_by(int64_t factor) const;
    Money divided_by(const BigDecimal& divisor, RoundingMode mode = RoundingMode::UNNECESSARY) const;
    Money divided_by(int64_t divisor, RoundingMode mode = RoundingMode::UNNECESSARY) const;

    Money negated() const;
    Money abs() const;

    // Result lands on the target currency's decimal places
    Money converted_to(const CurrencyUnit& currency, const BigDecimal& rate,
                       RoundingMode mode = RoundingMode::UNNECESSARY) const;

    int compare_to(const Money& other) const { return money_.compare_to(other.money_); }
    bool is_equal(const Money& other) const { return compare_to(other) == 0; }
    bool is_greater_than(const Money& other) const { return compare_to(other) > 0; }
    bool is_less_than(const Money& other) const { return compare_to(other) < 0; }

    const BigMoney& to_big_money() const noexcept { return money_; }
    std::string to_string() const { return money_.to_string(); }

    bool operator==(const Money& other) const { return money_ == other.money_; }

private:
    explicit Money(BigMoney money);

    Money with(const BigMoney& result, RoundingMode mode) const;

    BigMoney money_;
};

} // namespace dme::domain
