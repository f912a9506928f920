#pragma once

#include <stdexcept>
#include <string>

namespace dme::domain {

enum class RoundingMode {
    UP,
    DOWN,
    CEILING,
    FLOOR,
    HALF_UP,
    HALF_DOWN,
    HALF_EVEN,
    UNNECESSARY
};

inline RoundingMode rounding_mode_from_string(const std::string& str) {
    if (str == "UP") return RoundingMode::UP;
    if (str == "DOWN") return RoundingMode::DOWN;
    if (str == "CEILING") return RoundingMode::CEILING;
    if (str == "FLOOR") return RoundingMode::FLOOR;
    if (str == "HALF_UP") return RoundingMode::HALF_UP;
    if (str == "HALF_DOWN") return RoundingMode::HALF_DOWN;
    if (str == "HALF_EVEN") return RoundingMode::HALF_EVEN;
    if (str == "UNNECESSARY") return RoundingMode::UNNECESSARY;
    throw std::invalid_argument("Invalid rounding mode: " + str);
}

inline std::string to_string(RoundingMode mode) {
    switch (mode) {
        case RoundingMode::UP: return "UP";
        case RoundingMode::DOWN: return "DOWN";
        case RoundingMode::CEILING: return "CEILING";
        case RoundingMode::FLOOR: return "FLOOR";
        case RoundingMode::HALF_UP: return "HALF_UP";
        case RoundingMode::HALF_DOWN: return "HALF_DOWN";
        case RoundingMode::HALF_EVEN: return "HALF_EVEN";
        case RoundingMode::UNNECESSARY: return "UNNECESSARY";
    }
    throw std::invalid_argument("Invalid rounding mode");
}

} // namespace dme::domain
