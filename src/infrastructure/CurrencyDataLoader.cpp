#include "infrastructure/CurrencyDataLoader.hpp"

#include "repositories/InMemoryCurrencyRepository.hpp"

#ifdef DME_HAS_ARROW
#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#endif

#include <nlohmann/json.hpp>

#include <stdexcept>

using json = nlohmann::json;
using dme::domain::CurrencyUnit;

namespace dme::infrastructure {

namespace {

const char* kBuiltinCurrencyData = R"({
  "currencies": [
    {"code": "ALL", "numeric_code": 8,   "decimal_places": 2},
    {"code": "AUD", "numeric_code": 36,  "decimal_places": 2, "symbols": {"en_AU": "$"}},
    {"code": "BHD", "numeric_code": 48,  "decimal_places": 3},
    {"code": "BRL", "numeric_code": 986, "decimal_places": 2, "symbols": {"pt_BR": "R$"}},
    {"code": "CAD", "numeric_code": 124, "decimal_places": 2, "symbols": {"en_CA": "$", "fr_CA": "$"}},
    {"code": "CHF", "numeric_code": 756, "decimal_places": 2, "symbols": {"de_CH": "CHF", "fr_CH": "CHF"}},
    {"code": "CLP", "numeric_code": 152, "decimal_places": 0, "symbols": {"es_CL": "$"}},
    {"code": "CNY", "numeric_code": 156, "decimal_places": 2, "symbols": {"zh_CN": "¥"}},
    {"code": "DKK", "numeric_code": 208, "decimal_places": 2, "symbols": {"da_DK": "kr."}},
    {"code": "EUR", "numeric_code": 978, "decimal_places": 2,
     "symbols": {"de": "€", "fr": "€", "es": "€", "it": "€", "nl": "€", "pt_PT": "€"}},
    {"code": "GBP", "numeric_code": 826, "decimal_places": 2, "symbols": {"en_GB": "£"}},
    {"code": "HKD", "numeric_code": 344, "decimal_places": 2, "symbols": {"zh_HK": "HK$"}},
    {"code": "INR", "numeric_code": 356, "decimal_places": 2, "symbols": {"hi_IN": "₹", "en_IN": "₹"}},
    {"code": "ISK", "numeric_code": 352, "decimal_places": 0, "symbols": {"is_IS": "kr"}},
    {"code": "JPY", "numeric_code": 392, "decimal_places": 0, "symbols": {"ja_JP": "￥"}},
    {"code": "KRW", "numeric_code": 410, "decimal_places": 0, "symbols": {"ko_KR": "₩"}},
    {"code": "KWD", "numeric_code": 414, "decimal_places": 3},
    {"code": "MXN", "numeric_code": 484, "decimal_places": 2, "symbols": {"es_MX": "$"}},
    {"code": "NOK", "numeric_code": 578, "decimal_places": 2, "symbols": {"nb_NO": "kr"}},
    {"code": "NZD", "numeric_code": 554, "decimal_places": 2, "symbols": {"en_NZ": "$"}},
    {"code": "PLN", "numeric_code": 985, "decimal_places": 2, "symbols": {"pl_PL": "zł"}},
    {"code": "RUB", "numeric_code": 643, "decimal_places": 2, "symbols": {"ru_RU": "₽"}},
    {"code": "SEK", "numeric_code": 752, "decimal_places": 2, "symbols": {"sv_SE": "kr"}},
    {"code": "SGD", "numeric_code": 702, "decimal_places": 2, "symbols": {"en_SG": "$"}},
    {"code": "TND", "numeric_code": 788, "decimal_places": 3},
    {"code": "USD", "numeric_code": 840, "decimal_places": 2, "symbols": {"en_US": "$", "es_US": "$"}},
    {"code": "XAG", "numeric_code": 961, "decimal_places": -1},
    {"code": "XAU", "numeric_code": 959, "decimal_places": -1},
    {"code": "XXX", "numeric_code": 999, "decimal_places": -1},
    {"code": "ZAR", "numeric_code": 710, "decimal_places": 2, "symbols": {"en_ZA": "R"}}
  ]
})";

CurrencyUnit parse_currency(const json& obj) {
    if (!obj.is_object() || !obj.contains("code") || !obj["code"].is_string()) {
        throw std::invalid_argument("Currency entry requires a string 'code'");
    }
    auto code = obj["code"].get<std::string>();

    int numeric_code = -1;
    if (obj.contains("numeric_code")) {
        if (!obj["numeric_code"].is_number_integer()) {
            throw std::invalid_argument("Currency " + code + " has a non-integer 'numeric_code'");
        }
        numeric_code = obj["numeric_code"].get<int>();
    }

    if (!obj.contains("decimal_places") || !obj["decimal_places"].is_number_integer()) {
        throw std::invalid_argument("Currency " + code + " requires an integer 'decimal_places'");
    }
    auto decimal_places = obj["decimal_places"].get<int>();

    CurrencyUnit::SymbolTable symbols;
    if (obj.contains("symbols")) {
        if (!obj["symbols"].is_object()) {
            throw std::invalid_argument("Currency " + code + " has malformed 'symbols'");
        }
        for (const auto& [locale_tag, symbol] : obj["symbols"].items()) {
            if (!symbol.is_string()) {
                throw std::invalid_argument("Currency " + code + " has a non-string symbol for " + locale_tag);
            }
            symbols.emplace(locale_tag, symbol.get<std::string>());
        }
    }

    return CurrencyUnit(std::move(code), numeric_code, decimal_places, std::move(symbols));
}

} // anonymous namespace

std::vector<CurrencyUnit> CurrencyDataLoader::parse(const std::string& json_text) {
    auto doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
        throw std::invalid_argument("Currency data is not valid JSON");
    }
    if (!doc.is_object() || !doc.contains("currencies") || !doc["currencies"].is_array()) {
        throw std::invalid_argument("Currency data requires a 'currencies' array");
    }

    std::vector<CurrencyUnit> currencies;
    for (const auto& entry : doc["currencies"]) {
        currencies.push_back(parse_currency(entry));
    }
    return currencies;
}

size_t CurrencyDataLoader::load_into(dme::repositories::ICurrencyRepository& repository,
                                     const std::string& json_text) {
    auto currencies = parse(json_text);
    for (const auto& currency : currencies) {
        repository.register_currency(currency);
    }
    return currencies.size();
}

#ifdef DME_HAS_ARROW
size_t CurrencyDataLoader::load_from(dme::repositories::ICurrencyRepository& repository,
                                     const std::shared_ptr<arrow::fs::FileSystem>& fs,
                                     const std::string& path) {
    if (!fs) {
        throw std::invalid_argument("Currency data filesystem must not be null");
    }

    auto result = fs->OpenInputFile(path);
    if (!result.ok()) {
        throw std::runtime_error("Cannot open currency data " + path + ": " + result.status().ToString());
    }

    auto file = *result;
    auto size_result = file->GetSize();
    if (!size_result.ok()) {
        throw std::runtime_error("Cannot size currency data " + path + ": " + size_result.status().ToString());
    }

    auto buf_result = file->Read(*size_result);
    if (!buf_result.ok()) {
        throw std::runtime_error("Cannot read currency data " + path + ": " + buf_result.status().ToString());
    }

    std::string content(reinterpret_cast<const char*>((*buf_result)->data()),
                        static_cast<size_t>((*buf_result)->size()));
    return load_into(repository, content);
}
#endif

const std::string& CurrencyDataLoader::builtin_currency_data() {
    static const std::string data(kBuiltinCurrencyData);
    return data;
}

std::shared_ptr<dme::repositories::ICurrencyRepository> default_currencies() {
    static const std::shared_ptr<dme::repositories::ICurrencyRepository> repository = [] {
        auto repo = std::make_shared<dme::repositories::InMemoryCurrencyRepository>();
        CurrencyDataLoader::load_into(*repo, CurrencyDataLoader::builtin_currency_data());
        return repo;
    }();
    return repository;
}

} // namespace dme::infrastructure
