#pragma once

#include "domain/ExchangeRate.hpp"
#include <string>

namespace ledger::ports::output {

/**
 * @brief Провайдер курсов для движка транзакций
 *
 * Реализации:
 * - ExchangeRateService: primary/fallback без кэша
 * - CachedExchangeRateProvider: TTL-кэш + single-flight поверх ExchangeRateService
 */
class IExchangeRateProvider {
public:
    virtual ~IExchangeRateProvider() = default;

    /**
     * @brief Курс from -> to
     * @throws domain::LedgerException с кодом RATE_UNAVAILABLE, если курс получить нельзя
     */
    virtual domain::ExchangeRate getRate(const std::string& fromCurrency, const std::string& toCurrency) = 0;

    /**
     * @brief Имя источника, который последним успешно отдал курс
     */
    virtual std::string currentSourceName() const = 0;
};

} // namespace ledger::ports::output
