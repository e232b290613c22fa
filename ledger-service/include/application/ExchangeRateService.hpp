#pragma once

#include "ports/output/IExchangeRateProvider.hpp"
#include "ports/output/IExchangeRateSource.hpp"
#include "domain/ExchangeRate.hpp"
#include "domain/LedgerException.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ledger::application {

/**
 * @brief Курсы валют: primary API, при сбое fallback API
 *
 * Обход источников идёт по явной последовательности состояний:
 * PRIMARY_ATTEMPT -> FALLBACK_ATTEMPT -> FAIL.
 * Таймаут, не-2xx или битый ответ источника переводят в следующее состояние.
 * FAIL означает RATE_UNAVAILABLE; устаревший или угаданный курс не подставляется.
 *
 * Каждый запрос начинается с primary, даже если предыдущий обслужил fallback.
 * Кэша здесь нет, его добавляет CachedExchangeRateProvider.
 */
class ExchangeRateService : public ports::output::IExchangeRateProvider {
public:
    enum class FetchState {
        PRIMARY_ATTEMPT,
        FALLBACK_ATTEMPT,
        FAIL
    };

    ExchangeRateService(
        std::shared_ptr<ports::output::IExchangeRateSource> primary,
        std::shared_ptr<ports::output::IExchangeRateSource> fallback
    ) : primary_(std::move(primary))
      , fallback_(std::move(fallback))
      , currentSource_(primary_->name())
    {
        std::cout << "[ExchangeRateService] Created: primary=" << primary_->name()
                  << " fallback=" << fallback_->name() << std::endl;
    }

    domain::ExchangeRate getRate(const std::string& fromCurrency, const std::string& toCurrency) override {
        if (fromCurrency == toCurrency) {
            return domain::ExchangeRate::identity(fromCurrency);
        }

        FetchState state = FetchState::PRIMARY_ATTEMPT;
        std::optional<domain::ExchangeRate> rate;

        while (!rate && state != FetchState::FAIL) {
            switch (state) {
                case FetchState::PRIMARY_ATTEMPT:
                    rate = attempt(*primary_, domain::RateSource::PRIMARY, fromCurrency, toCurrency);
                    if (!rate) {
                        state = FetchState::FALLBACK_ATTEMPT;
                    }
                    break;
                case FetchState::FALLBACK_ATTEMPT:
                    rate = attempt(*fallback_, domain::RateSource::FALLBACK, fromCurrency, toCurrency);
                    if (!rate) {
                        state = FetchState::FAIL;
                    }
                    break;
                case FetchState::FAIL:
                    break;
            }
        }

        if (!rate) {
            std::cerr << "[ExchangeRateService] No source could provide "
                      << fromCurrency << "/" << toCurrency << std::endl;
            throw domain::LedgerException(
                domain::ErrorCode::RATE_UNAVAILABLE,
                "Could not get exchange rate from " + fromCurrency + " to " + toCurrency + " from any source");
        }

        return *rate;
    }

    std::string currentSourceName() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return currentSource_;
    }

private:
    std::optional<domain::ExchangeRate> attempt(
        ports::output::IExchangeRateSource& source,
        domain::RateSource tag,
        const std::string& fromCurrency,
        const std::string& toCurrency)
    {
        std::optional<domain::ExchangeRate> rate;
        try {
            rate = source.fetchRate(fromCurrency, toCurrency);
        } catch (const std::exception& e) {
            std::cerr << "[ExchangeRateService] " << source.name() << " error: " << e.what() << std::endl;
            return std::nullopt;
        }

        if (!rate) {
            std::cerr << "[ExchangeRateService] " << source.name() << " has no rate for "
                      << fromCurrency << "/" << toCurrency << std::endl;
            return std::nullopt;
        }
        if (rate->fromCurrency != fromCurrency || rate->toCurrency != toCurrency || !rate->rate.isPositive()) {
            std::cerr << "[ExchangeRateService] " << source.name() << " returned malformed rate "
                      << rate->pairKey() << "=" << rate->rate.toString() << std::endl;
            return std::nullopt;
        }

        rate->source = tag;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            currentSource_ = source.name();
        }
        return rate;
    }

    std::shared_ptr<ports::output::IExchangeRateSource> primary_;
    std::shared_ptr<ports::output::IExchangeRateSource> fallback_;

    mutable std::mutex mutex_;
    std::string currentSource_;
};

} // namespace ledger::application
