#pragma once

#include "Rate.hpp"
#include "Timestamp.hpp"
#include "enums/RateSource.hpp"
#include <string>
#include <optional>

namespace ledger::domain {

/**
 * @brief Курс валютной пары (направленный: 1 from = rate to)
 *
 * Эфемерный объект: живёт в кэше провайдера и не хранится в леджере.
 * Применённый курс сохраняется в записи Transaction.
 */
struct ExchangeRate {
    std::string fromCurrency;
    std::string toCurrency;
    Rate rate = Rate::one();
    RateSource source = RateSource::IDENTITY;
    Timestamp fetchedAt;
    std::optional<Timestamp> expiresAt;

    static ExchangeRate identity(const std::string& currency) {
        ExchangeRate r;
        r.fromCurrency = currency;
        r.toCurrency = currency;
        r.rate = Rate::one();
        r.source = RateSource::IDENTITY;
        return r;
    }

    bool isExpired(const Timestamp& now) const {
        return expiresAt.has_value() && !(now < *expiresAt);
    }

    std::string pairKey() const {
        return fromCurrency + "/" + toCurrency;
    }
};

} // namespace ledger::domain
