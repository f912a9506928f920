#pragma once

#include "domain/value_objects/BigMoney.hpp"
#include "format/ParseContext.hpp"
#include "format/PrintContext.hpp"

#include <string>

namespace dme::format {

// User supplied printing element. Implementations must be immutable,
// a formatter shares them between threads.
class MoneyPrinter {
public:
    virtual void print(const PrintContext& context, std::string& out,
                       const dme::domain::BigMoney& money) const = 0;
    virtual std::string describe() const { return "${user}"; }
    virtual ~MoneyPrinter() = default;
};

// User supplied parsing element. On success it advances the context index,
// on failure it records an error through the context.
class MoneyParser {
public:
    virtual void parse(ParseContext& context) const = 0;
    virtual ~MoneyParser() = default;
};

} // namespace dme::format
