#include "config/Settings.hpp"

#include <cstdlib>
#include <stdexcept>

namespace dme::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string str(val);
    if (str == "true" || str == "1") return true;
    if (str == "false" || str == "0") return false;
    return fallback;
}

} // namespace

Settings Settings::from_environment() {
    std::string env = env_or("DME_ENV", "development");
    Settings s = (env == "production") ? production() : development();
    s.format.locale = env_or("DME_LOCALE", s.format.locale);
    s.format.grouping = env_bool_or("DME_GROUPING", s.format.grouping);
    s.format.grouping_size = env_int_or("DME_GROUPING_SIZE", s.format.grouping_size);
    s.format.force_decimal_point = env_bool_or("DME_FORCE_DECIMAL_POINT", s.format.force_decimal_point);
    s.format.layout = env_or("DME_LAYOUT", s.format.layout);
    s.arithmetic.rounding_mode = env_or("DME_ROUNDING_MODE", s.arithmetic.rounding_mode);
    s.currency.data_file = env_or("DME_CURRENCY_DATA_FILE", s.currency.data_file);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.arithmetic.rounding_mode = "HALF_EVEN";
    return s;
}

// Production refuses to round silently and prints machine-friendly amounts
Settings Settings::production() {
    Settings s;
    s.arithmetic.rounding_mode = "UNNECESSARY";
    s.format.grouping = false;
    return s;
}

} // namespace dme::config
