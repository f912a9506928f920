#include "domain/value_objects/BigDecimal.hpp"

#include "domain/errors/MoneyErrors.hpp"

#include <algorithm>
#include <stdexcept>

namespace dme::domain {

BigDecimal::Integer divide_and_round(const BigDecimal::Integer& numerator,
                                     const BigDecimal::Integer& denominator,
                                     RoundingMode mode) {
    if (denominator.is_zero()) {
        throw std::invalid_argument("Division by zero");
    }

    // cpp_int truncates towards zero, the remainder takes the numerator's sign
    BigDecimal::Integer quotient = numerator / denominator;
    BigDecimal::Integer remainder = numerator % denominator;
    if (remainder.is_zero()) {
        return quotient;
    }

    const int sign = numerator.sign() * denominator.sign();
    const BigDecimal::Integer twice_remainder = boost::multiprecision::abs(remainder) * 2;
    const int half_cmp = twice_remainder.compare(BigDecimal::Integer(boost::multiprecision::abs(denominator)));

    bool away_from_zero = false;
    switch (mode) {
        case RoundingMode::UP:
            away_from_zero = true;
            break;
        case RoundingMode::DOWN:
            away_from_zero = false;
            break;
        case RoundingMode::CEILING:
            away_from_zero = sign > 0;
            break;
        case RoundingMode::FLOOR:
            away_from_zero = sign < 0;
            break;
        case RoundingMode::HALF_UP:
            away_from_zero = half_cmp >= 0;
            break;
        case RoundingMode::HALF_DOWN:
            away_from_zero = half_cmp > 0;
            break;
        case RoundingMode::HALF_EVEN:
            away_from_zero = half_cmp > 0 || (half_cmp == 0 && quotient % 2 != 0);
            break;
        case RoundingMode::UNNECESSARY:
            throw UnnecessaryRoundingError();
    }

    if (away_from_zero) {
        quotient += sign;
    }
    return quotient;
}

BigDecimal::BigDecimal() : unscaled_(0), scale_(0) {}

BigDecimal::BigDecimal(Integer unscaled_value, int32_t scale)
    : unscaled_(std::move(unscaled_value))
    , scale_(scale) {
    if (scale < 0) {
        throw std::invalid_argument("Scale must not be negative, got: " + std::to_string(scale));
    }
}

BigDecimal BigDecimal::of(int64_t value) {
    return BigDecimal(Integer(value), 0);
}

BigDecimal BigDecimal::from_string(const std::string& str) {
    size_t pos = 0;
    bool negative = false;
    if (pos < str.size() && (str[pos] == '+' || str[pos] == '-')) {
        negative = str[pos] == '-';
        ++pos;
    }

    std::string digits;
    int32_t scale = 0;
    bool decimal_point_seen = false;
    for (; pos < str.size(); ++pos) {
        char c = str[pos];
        if (c >= '0' && c <= '9') {
            digits += c;
            if (decimal_point_seen) ++scale;
        } else if (c == '.' && !decimal_point_seen) {
            decimal_point_seen = true;
        } else {
            throw std::invalid_argument("Invalid decimal: '" + str + "'");
        }
    }
    if (digits.empty()) {
        throw std::invalid_argument("Invalid decimal: '" + str + "'");
    }

    Integer unscaled(digits);
    if (negative) unscaled = -unscaled;
    return BigDecimal(std::move(unscaled), scale);
}

BigDecimal::Integer BigDecimal::ten_pow(int32_t exponent) {
    if (exponent < 0) {
        throw std::invalid_argument("Exponent must not be negative");
    }
    return boost::multiprecision::pow(Integer(10), static_cast<unsigned>(exponent));
}

int BigDecimal::signum() const {
    return unscaled_.sign();
}

BigDecimal BigDecimal::negated() const {
    return BigDecimal(-unscaled_, scale_);
}

BigDecimal BigDecimal::abs() const {
    return unscaled_.sign() < 0 ? negated() : *this;
}

BigDecimal BigDecimal::plus(const BigDecimal& other) const {
    int32_t scale = std::max(scale_, other.scale_);
    Integer sum = unscaled_ * ten_pow(scale - scale_) + other.unscaled_ * ten_pow(scale - other.scale_);
    return BigDecimal(std::move(sum), scale);
}

BigDecimal BigDecimal::minus(const BigDecimal& other) const {
    return plus(other.negated());
}

BigDecimal BigDecimal::multiplied_by(const BigDecimal& other) const {
    return BigDecimal(unscaled_ * other.unscaled_, scale_ + other.scale_);
}

BigDecimal BigDecimal::divided_by(const BigDecimal& divisor, int32_t scale, RoundingMode mode) const {
    if (divisor.is_zero()) {
        throw std::invalid_argument("Division by zero");
    }
    if (scale < 0) {
        throw std::invalid_argument("Scale must not be negative, got: " + std::to_string(scale));
    }
    // (u1 * 10^-s1) / (u2 * 10^-s2) * 10^scale = u1 * 10^(s2 + scale) / (u2 * 10^s1)
    Integer numerator = unscaled_ * ten_pow(divisor.scale_ + scale);
    Integer denominator = divisor.unscaled_ * ten_pow(scale_);
    return BigDecimal(divide_and_round(numerator, denominator, mode), scale);
}

BigDecimal BigDecimal::with_scale(int32_t scale, RoundingMode mode) const {
    if (scale < 0) {
        throw std::invalid_argument("Scale must not be negative, got: " + std::to_string(scale));
    }
    if (scale == scale_) {
        return *this;
    }
    if (scale > scale_) {
        return BigDecimal(unscaled_ * ten_pow(scale - scale_), scale);
    }
    return BigDecimal(divide_and_round(unscaled_, ten_pow(scale_ - scale), mode), scale);
}

BigDecimal BigDecimal::strip_trailing_zeros() const {
    if (unscaled_.is_zero()) {
        return BigDecimal();
    }
    Integer unscaled = unscaled_;
    int32_t scale = scale_;
    while (scale > 0 && unscaled % 10 == 0) {
        unscaled /= 10;
        --scale;
    }
    return BigDecimal(std::move(unscaled), scale);
}

std::string BigDecimal::to_plain_string() const {
    std::string digits = Integer(boost::multiprecision::abs(unscaled_)).str();
    if (scale_ > 0) {
        auto width = static_cast<size_t>(scale_) + 1;
        if (digits.size() < width) {
            digits.insert(0, width - digits.size(), '0');
        }
        digits.insert(digits.size() - static_cast<size_t>(scale_), 1, '.');
    }
    return unscaled_.sign() < 0 ? "-" + digits : digits;
}

std::strong_ordering BigDecimal::operator<=>(const BigDecimal& other) const {
    int32_t scale = std::max(scale_, other.scale_);
    Integer lhs = unscaled_ * ten_pow(scale - scale_);
    Integer rhs = other.unscaled_ * ten_pow(scale - other.scale_);
    int cmp = lhs.compare(rhs);
    if (cmp < 0) return std::strong_ordering::less;
    if (cmp > 0) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

bool BigDecimal::operator==(const BigDecimal& other) const {
    return (*this <=> other) == std::strong_ordering::equal;
}

} // namespace dme::domain
