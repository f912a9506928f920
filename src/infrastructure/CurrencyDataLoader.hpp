#pragma once

#include "domain/value_objects/CurrencyUnit.hpp"
#include "repositories/ICurrencyRepository.hpp"

#ifdef DME_HAS_ARROW
#include <arrow/filesystem/filesystem.h>
#endif

#include <memory>
#include <string>
#include <vector>

namespace dme::infrastructure {

class CurrencyDataLoader {
public:
    // Parses a document of the form
    //   {"currencies": [{"code": "USD", "numeric_code": 840,
    //                    "decimal_places": 2, "symbols": {"en_US": "$"}}]}
    // Throws std::invalid_argument on malformed input.
    static std::vector<dme::domain::CurrencyUnit> parse(const std::string& json_text);

    // Returns the number of currencies registered.
    static size_t load_into(dme::repositories::ICurrencyRepository& repository,
                            const std::string& json_text);

#ifdef DME_HAS_ARROW
    static size_t load_from(dme::repositories::ICurrencyRepository& repository,
                            const std::shared_ptr<arrow::fs::FileSystem>& fs,
                            const std::string& path);
#endif

    // ISO 4217 subset shipped with the library
    static const std::string& builtin_currency_data();
};

// Process-wide repository seeded with the built-in data.
std::shared_ptr<dme::repositories::ICurrencyRepository> default_currencies();

} // namespace dme::infrastructure
