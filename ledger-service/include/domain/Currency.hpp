#pragma once

#include <string>
#include <unordered_map>
#include <stdexcept>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Справочник валют: код ISO-4217 -> количество знаков после запятой
 *
 * Масштаб валюты определяет минорную единицу (цент, копейка, сен).
 * Все суммы в Money хранятся в минорных единицах своей валюты.
 */
inline const std::unordered_map<std::string, int>& currencyScales() {
    static const std::unordered_map<std::string, int> scales = {
        {"USD", 2}, {"EUR", 2}, {"GBP", 2}, {"PEN", 2}, {"RUB", 2},
        {"CHF", 2}, {"CAD", 2}, {"MXN", 2}, {"BRL", 2}, {"CNY", 2},
        {"JPY", 0}, {"KRW", 0}, {"CLP", 0},
        {"KWD", 3}, {"BHD", 3}, {"JOD", 3}
    };
    return scales;
}

inline bool isSupportedCurrency(const std::string& code) {
    return currencyScales().count(code) > 0;
}

/**
 * @brief Масштаб валюты
 * @throws std::invalid_argument для неизвестного кода
 */
inline int currencyScale(const std::string& code) {
    auto it = currencyScales().find(code);
    if (it == currencyScales().end()) {
        throw std::invalid_argument("Unsupported currency: " + code);
    }
    return it->second;
}

inline int64_t pow10(int exponent) {
    int64_t result = 1;
    for (int i = 0; i < exponent; ++i) {
        result *= 10;
    }
    return result;
}

} // namespace ledger::domain
