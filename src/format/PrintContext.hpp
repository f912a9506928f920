#pragma once

#include "format/Locale.hpp"

namespace dme::format {

// Per-call state handed to each printer.
class PrintContext {
public:
    explicit PrintContext(Locale locale) : locale_(std::move(locale)) {}

    const Locale& locale() const noexcept { return locale_; }

private:
    Locale locale_;
};

} // namespace dme::format
