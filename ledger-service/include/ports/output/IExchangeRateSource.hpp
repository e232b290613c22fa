#pragma once

#include "domain/ExchangeRate.hpp"
#include <optional>
#include <string>

namespace ledger::ports::output {

/**
 * @brief Внешний источник курсов (один HTTP API)
 *
 * Таймаут, не-2xx ответ или битый payload дают nullopt, без исключений.
 * Решение, что делать дальше, принимает ExchangeRateService.
 */
class IExchangeRateSource {
public:
    virtual ~IExchangeRateSource() = default;

    virtual std::optional<domain::ExchangeRate> fetchRate(
        const std::string& fromCurrency,
        const std::string& toCurrency) = 0;

    virtual std::string name() const = 0;
};

} // namespace ledger::ports::output
