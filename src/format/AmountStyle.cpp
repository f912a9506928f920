#include "format/AmountStyle.hpp"

#include <stdexcept>
#include <string>

namespace dme::format {

AmountStyle::AmountStyle(std::optional<char> zero, std::optional<char> decimal_point,
                         std::optional<char> grouping_char, std::optional<int> grouping_size,
                         bool grouping, bool force_decimal_point)
    : zero_character_(zero)
    , decimal_point_character_(decimal_point)
    , grouping_character_(grouping_char)
    , grouping_size_(grouping_size)
    , grouping_(grouping)
    , force_decimal_point_(force_decimal_point) {
    if (grouping_size_ && *grouping_size_ <= 0) {
        throw std::invalid_argument(
            "Grouping size must be positive, got: " + std::to_string(*grouping_size_));
    }
}

AmountStyle AmountStyle::ascii_decimal_point_group3_comma() {
    return AmountStyle('0', '.', ',', 3, true, false);
}

AmountStyle AmountStyle::ascii_decimal_point_group3_space() {
    return AmountStyle('0', '.', ' ', 3, true, false);
}

AmountStyle AmountStyle::ascii_decimal_point_no_grouping() {
    return AmountStyle('0', '.', ',', 3, false, false);
}

AmountStyle AmountStyle::ascii_decimal_comma_group3_dot() {
    return AmountStyle('0', ',', '.', 3, true, false);
}

AmountStyle AmountStyle::ascii_decimal_comma_group3_space() {
    return AmountStyle('0', ',', ' ', 3, true, false);
}

AmountStyle AmountStyle::ascii_decimal_comma_no_grouping() {
    return AmountStyle('0', ',', '.', 3, false, false);
}

AmountStyle AmountStyle::localized_grouping() {
    return AmountStyle(std::nullopt, std::nullopt, std::nullopt, std::nullopt, true, false);
}

AmountStyle AmountStyle::localized_no_grouping() {
    return AmountStyle(std::nullopt, std::nullopt, std::nullopt, std::nullopt, false, false);
}

AmountStyle AmountStyle::localize(const Locale& locale) const {
    if (is_resolved()) return *this;

    auto symbols = LocaleSymbols::of(locale);
    AmountStyle result = *this;
    if (!result.zero_character_) result.zero_character_ = symbols.zero_digit;
    if (!result.decimal_point_character_) result.decimal_point_character_ = symbols.decimal_point;
    if (!result.grouping_character_) result.grouping_character_ = symbols.grouping_separator;
    if (!result.grouping_size_) result.grouping_size_ = symbols.grouping_size;
    return result;
}

bool AmountStyle::is_resolved() const noexcept {
    return zero_character_ && decimal_point_character_ && grouping_character_ && grouping_size_;
}

AmountStyle AmountStyle::with_zero_character(char zero) const {
    AmountStyle result = *this;
    result.zero_character_ = zero;
    return result;
}

AmountStyle AmountStyle::with_decimal_point_character(char decimal_point) const {
    AmountStyle result = *this;
    result.decimal_point_character_ = decimal_point;
    return result;
}

AmountStyle AmountStyle::with_grouping_character(char grouping) const {
    AmountStyle result = *this;
    result.grouping_character_ = grouping;
    return result;
}

AmountStyle AmountStyle::with_grouping_size(int size) const {
    return AmountStyle(zero_character_, decimal_point_character_, grouping_character_,
                       size, grouping_, force_decimal_point_);
}

AmountStyle AmountStyle::with_grouping(bool grouping) const {
    AmountStyle result = *this;
    result.grouping_ = grouping;
    return result;
}

AmountStyle AmountStyle::with_forced_decimal_point(bool force) const {
    AmountStyle result = *this;
    result.force_decimal_point_ = force;
    return result;
}

} // namespace dme::format
