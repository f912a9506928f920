#include "config/Settings.hpp"
#include "domain/errors/MoneyErrors.hpp"
#include "domain/value_objects/BigMoney.hpp"
#include "domain/value_objects/Money.hpp"
#include "domain/value_objects/RoundingMode.hpp"
#include "format/MoneyFormatterBuilder.hpp"
#include "infrastructure/CurrencyDataLoader.hpp"
#include "infrastructure/MoneyJsonCodec.hpp"
#include "repositories/InMemoryCurrencyRepository.hpp"

#ifdef DME_HAS_ARROW
#include <arrow/filesystem/localfs.h>
#endif

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace dme::domain;

namespace {

void print_usage() {
    std::cerr << "Usage: money_engine format <CODE> <amount>" << std::endl;
    std::cerr << "       money_engine parse <text>" << std::endl;
    std::cerr << "       money_engine convert <CODE> <amount> <TARGET> <rate>" << std::endl;
}

std::shared_ptr<dme::repositories::ICurrencyRepository> load_currencies(
    const dme::config::CurrencySettings& settings) {
    if (settings.data_file.empty()) {
        return dme::infrastructure::default_currencies();
    }
#ifdef DME_HAS_ARROW
    auto repo = std::make_shared<dme::repositories::InMemoryCurrencyRepository>();
    dme::infrastructure::CurrencyDataLoader::load_into(
        *repo, dme::infrastructure::CurrencyDataLoader::builtin_currency_data());
    auto fs = std::make_shared<arrow::fs::LocalFileSystem>();
    auto added = dme::infrastructure::CurrencyDataLoader::load_from(*repo, fs, settings.data_file);
    std::cout << "[currency] Loaded " << added << " currencies from "
              << settings.data_file << std::endl;
    return repo;
#else
    throw std::runtime_error("Currency data file requested but not compiled in. "
                             "Rebuild with Apache Arrow installed.");
#endif
}

dme::format::MoneyFormatter make_formatter(
    const dme::config::FormatSettings& settings,
    std::shared_ptr<const dme::repositories::ICurrencyRepository> currencies) {
    auto style = dme::format::AmountStyle::localized_grouping()
                     .with_grouping(settings.grouping)
                     .with_grouping_size(settings.grouping_size)
                     .with_forced_decimal_point(settings.force_decimal_point);

    dme::format::MoneyFormatterBuilder builder;
    if (settings.layout == "amount_code") {
        builder.append_amount(style).append_literal(" ").append_currency_code();
    } else if (settings.layout == "symbol_amount") {
        builder.append_currency_symbol_localized().append_amount(style);
    } else if (settings.layout == "code_amount") {
        builder.append_currency_code().append_literal(" ").append_amount(style);
    } else {
        throw std::invalid_argument("Unknown layout: " + settings.layout);
    }
    return builder.to_formatter(dme::format::Locale::from_string(settings.locale), std::move(currencies));
}

} // namespace

int main(int argc, char* argv[]) {
    auto settings = dme::config::Settings::from_environment();

    if (argc < 2) {
        print_usage();
        return 1;
    }
    std::string command = argv[1];

    try {
        auto currencies = load_currencies(settings.currency);
        auto mode = rounding_mode_from_string(settings.arithmetic.rounding_mode);
        auto formatter = make_formatter(settings.format, currencies);
        dme::infrastructure::MoneyJsonCodec codec(*currencies);

        if (command == "format" && argc == 4) {
            auto money = Money::of(currencies->of(argv[2]), BigDecimal::from_string(argv[3]), mode);
            std::cout << "[format] " << formatter.print(money) << std::endl;
            std::cout << "[format] " << codec.encode(money).dump() << std::endl;
        } else if (command == "parse" && argc == 3) {
            auto money = formatter.parse_big_money(argv[2]);
            std::cout << "[parse] " << money.to_string() << std::endl;
            std::cout << "[parse] " << codec.encode(money).dump() << std::endl;
        } else if (command == "convert" && argc == 6) {
            auto money = Money::of(currencies->of(argv[2]), BigDecimal::from_string(argv[3]), mode);
            auto converted = money.converted_to(currencies->of(argv[4]), BigDecimal::from_string(argv[5]), mode);
            std::cout << "[convert] " << formatter.print(money) << " -> "
                      << formatter.print(converted) << std::endl;
        } else {
            print_usage();
            return 1;
        }
    } catch (const FormatParseError& e) {
        std::cerr << "[error] " << e.what() << " (index " << e.error_index() << ")" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[error] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
