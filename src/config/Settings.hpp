#pragma once

#include <string>

namespace dme::config {

struct FormatSettings {
    std::string locale = "en_US";
    bool grouping = true;
    int grouping_size = 3;
    bool force_decimal_point = false;
    std::string layout = "code_amount";   // "code_amount", "amount_code" or "symbol_amount"
};

struct ArithmeticSettings {
    std::string rounding_mode = "HALF_EVEN";
};

struct CurrencySettings {
    std::string data_file;                // empty uses the built-in ISO data
};

struct Settings {
    FormatSettings format;
    ArithmeticSettings arithmetic;
    CurrencySettings currency;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace dme::config
