#pragma once

#include "domain/value_objects/RoundingMode.hpp"

#include <boost/multiprecision/cpp_int.hpp>

#include <compare>
#include <cstdint>
#include <string>

namespace dme::domain {

// Exact decimal number: unscaled_value * 10^-scale, with scale >= 0.
class BigDecimal {
public:
    using Integer = boost::multiprecision::cpp_int;

    BigDecimal();
    BigDecimal(Integer unscaled_value, int32_t scale);

    static BigDecimal of(int64_t value);
    // Plain notation only: [+-]digits[.digits] or [+-].digits
    static BigDecimal from_string(const std::string& str);
    static Integer ten_pow(int32_t exponent);

    const Integer& unscaled_value() const noexcept { return unscaled_; }
    int32_t scale() const noexcept { return scale_; }

    int signum() const;
    bool is_zero() const { return unscaled_.is_zero(); }

    BigDecimal negated() const;
    BigDecimal abs() const;
    BigDecimal plus(const BigDecimal& other) const;
    BigDecimal minus(const BigDecimal& other) const;
    // Exact product, scale is the sum of both scales.
    BigDecimal multiplied_by(const BigDecimal& other) const;
    // Quotient expressed at the requested scale.
    BigDecimal divided_by(const BigDecimal& divisor, int32_t scale, RoundingMode mode) const;
    BigDecimal with_scale(int32_t scale, RoundingMode mode = RoundingMode::UNNECESSARY) const;
    BigDecimal strip_trailing_zeros() const;

    std::string to_plain_string() const;

    // Numeric comparison: 1.0 and 1.00 compare equal.
    std::strong_ordering operator<=>(const BigDecimal& other) const;
    bool operator==(const BigDecimal& other) const;

private:
    Integer unscaled_;
    int32_t scale_;
};

// Divides numerator by denominator, applying mode to the discarded remainder.
BigDecimal::Integer divide_and_round(const BigDecimal::Integer& numerator,
                                     const BigDecimal::Integer& denominator,
                                     RoundingMode mode);

} // namespace dme::domain
