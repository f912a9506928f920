#include "format/Locale.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace dme::format {

namespace {

std::string lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

// Keyed by full tag first, then by language alone.
const std::map<std::string, LocaleSymbols>& symbol_table() {
    static const std::map<std::string, LocaleSymbols> table = {
        {"en", {'0', '.', ',', 3}},
        {"ja", {'0', '.', ',', 3}},
        {"zh", {'0', '.', ',', 3}},
        {"de", {'0', ',', '.', 3}},
        {"de_CH", {'0', '.', '\'', 3}},
        {"es", {'0', ',', '.', 3}},
        {"it", {'0', ',', '.', 3}},
        {"nl", {'0', ',', '.', 3}},
        {"pt", {'0', ',', '.', 3}},
        {"fr", {'0', ',', ' ', 3}},
        {"sv", {'0', ',', ' ', 3}},
        {"ru", {'0', ',', ' ', 3}},
        {"pl", {'0', ',', ' ', 3}},
    };
    return table;
}

} // anonymous namespace

Locale::Locale(std::string language, std::string country)
    : language_(lower(std::move(language)))
    , country_(upper(std::move(country))) {}

Locale Locale::from_string(const std::string& tag) {
    auto sep = tag.find_first_of("_-");
    if (sep == std::string::npos) {
        return Locale(tag, "");
    }
    return Locale(tag.substr(0, sep), tag.substr(sep + 1));
}

std::string Locale::tag() const {
    if (country_.empty()) return language_;
    return language_ + "_" + country_;
}

LocaleSymbols LocaleSymbols::of(const Locale& locale) {
    const auto& table = symbol_table();
    auto it = table.find(locale.tag());
    if (it != table.end()) return it->second;
    it = table.find(locale.language());
    if (it != table.end()) return it->second;
    return LocaleSymbols{};
}

} // namespace dme::format
