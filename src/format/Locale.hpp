#pragma once

#include <compare>
#include <string>

namespace dme::format {

class Locale {
public:
    Locale() = default;
    Locale(std::string language, std::string country);

    // Accepts "de_DE", "de-DE", "de" or "" for the root locale
    static Locale from_string(const std::string& tag);

    static Locale root() { return Locale(); }
    static Locale us() { return Locale("en", "US"); }
    static Locale uk() { return Locale("en", "GB"); }
    static Locale germany() { return Locale("de", "DE"); }
    static Locale france() { return Locale("fr", "FR"); }
    static Locale switzerland() { return Locale("de", "CH"); }
    static Locale japan() { return Locale("ja", "JP"); }

    const std::string& language() const noexcept { return language_; }
    const std::string& country() const noexcept { return country_; }
    std::string tag() const;

    bool operator==(const Locale&) const = default;
    auto operator<=>(const Locale&) const = default;

private:
    std::string language_;
    std::string country_;
};

// Number formatting symbols of a locale.
struct LocaleSymbols {
    char zero_digit = '0';
    char decimal_point = '.';
    char grouping_separator = ',';
    int grouping_size = 3;

    static LocaleSymbols of(const Locale& locale);
};

} // namespace dme::format
