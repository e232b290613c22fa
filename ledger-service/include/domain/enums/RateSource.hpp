#pragma once

#include <string>

namespace ledger::domain {

/**
 * @brief Откуда получен курс
 *
 * IDENTITY: пара из одной валюты, курс ровно 1 без обращения к источникам.
 */
enum class RateSource {
    PRIMARY,
    FALLBACK,
    IDENTITY
};

inline std::string toString(RateSource source) {
    switch (source) {
        case RateSource::PRIMARY: return "PRIMARY";
        case RateSource::FALLBACK: return "FALLBACK";
        case RateSource::IDENTITY: return "IDENTITY";
        default: return "UNKNOWN";
    }
}

inline RateSource parseRateSource(const std::string& str) {
    if (str == "PRIMARY") return RateSource::PRIMARY;
    if (str == "FALLBACK") return RateSource::FALLBACK;
    return RateSource::IDENTITY;
}

} // namespace ledger::domain
