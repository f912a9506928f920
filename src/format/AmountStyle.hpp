#pragma once

#include "format/Locale.hpp"

#include <optional>

namespace dme::format {

// How the numeric part of a monetary amount is written.
// Characters left unset are taken from the locale when the style is localized;
// localize() returns a resolved copy and never changes this instance.
class AmountStyle {
public:
    // Presets
    static AmountStyle ascii_decimal_point_group3_comma();
    static AmountStyle ascii_decimal_point_group3_space();
    static AmountStyle ascii_decimal_point_no_grouping();
    static AmountStyle ascii_decimal_comma_group3_dot();
    static AmountStyle ascii_decimal_comma_group3_space();
    static AmountStyle ascii_decimal_comma_no_grouping();
    static AmountStyle localized_grouping();
    static AmountStyle localized_no_grouping();

    AmountStyle localize(const Locale& locale) const;

    const std::optional<char>& zero_character() const noexcept { return zero_character_; }
    const std::optional<char>& decimal_point_character() const noexcept { return decimal_point_character_; }
    const std::optional<char>& grouping_character() const noexcept { return grouping_character_; }
    const std::optional<int>& grouping_size() const noexcept { return grouping_size_; }
    bool is_grouping() const noexcept { return grouping_; }
    bool is_forced_decimal_point() const noexcept { return force_decimal_point_; }
    // True when every character and the grouping size are set
    bool is_resolved() const noexcept;

    AmountStyle with_zero_character(char zero) const;
    AmountStyle with_decimal_point_character(char decimal_point) const;
    AmountStyle with_grouping_character(char grouping) const;
    AmountStyle with_grouping_size(int size) const;
    AmountStyle with_grouping(bool grouping) const;
    AmountStyle with_forced_decimal_point(bool force) const;

    bool operator==(const AmountStyle&) const = default;

private:
    AmountStyle(std::optional<char> zero, std::optional<char> decimal_point,
                std::optional<char> grouping_char, std::optional<int> grouping_size,
                bool grouping, bool force_decimal_point);

    std::optional<char> zero_character_;
    std::optional<char> decimal_point_character_;
    std::optional<char> grouping_character_;
    std::optional<int> grouping_size_;
    bool grouping_;
    bool force_decimal_point_;
};

} // namespace dme::format
