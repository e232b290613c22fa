#pragma once

#include "ports/output/IExchangeRateProvider.hpp"
#include "application/ExchangeRateService.hpp"
#include "settings/CacheSettings.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief Декоратор провайдера курсов с TTL-кэшем и single-flight
 *
 * - rateCache_: "FROM/TO" -> ExchangeRate, LRU + глобальный TTL
 * - inFlight_: пары, за которыми уже пошли в upstream
 *
 * Одновременные промахи по одной паре ждут один общий запрос к delegate_.
 * Истёкшая запись не отдаётся никогда: если перезапрос не удался,
 * вызывающий получает RATE_UNAVAILABLE.
 */
class CachedExchangeRateProvider : public ports::output::IExchangeRateProvider {
public:
    CachedExchangeRateProvider(
        std::shared_ptr<application::ExchangeRateService> delegate,
        std::shared_ptr<settings::CacheSettings> cacheSettings
    ) : delegate_(std::move(delegate))
      , cacheSettings_(std::move(cacheSettings))
    {
        initCache();
    }

    domain::ExchangeRate getRate(const std::string& fromCurrency, const std::string& toCurrency) override {
        if (fromCurrency == toCurrency) {
            return domain::ExchangeRate::identity(fromCurrency);
        }

        const std::string key = fromCurrency + "/" + toCurrency;
        if (auto cached = fresh(key)) {
            return *cached;
        }

        std::promise<domain::ExchangeRate> promise;
        std::shared_future<domain::ExchangeRate> flight;
        bool leader = false;
        {
            std::lock_guard<std::mutex> lock(flightsMutex_);
            // Лидер мог положить курс в кэш, пока мы ждали мьютекс
            if (auto cached = fresh(key)) {
                return *cached;
            }
            auto it = inFlight_.find(key);
            if (it != inFlight_.end()) {
                flight = it->second;
            } else {
                flight = promise.get_future().share();
                inFlight_.emplace(key, flight);
                leader = true;
            }
        }

        if (!leader) {
            return flight.get();
        }

        try {
            auto rate = delegate_->getRate(fromCurrency, toCurrency);
            rate.expiresAt = domain::Timestamp::now().plus(ttl_);
            rateCache_->put(key, rate);
            finishFlight(key);
            promise.set_value(rate);
            return rate;
        } catch (...) {
            finishFlight(key);
            promise.set_exception(std::current_exception());
            throw;
        }
    }

    std::string currentSourceName() const override {
        return delegate_->currentSourceName();
    }

    void clearRateCache() {
        rateCache_->clear();
    }

    size_t getRateCacheSize() const {
        return rateCache_->size();
    }

private:
    std::optional<domain::ExchangeRate> fresh(const std::string& key) {
        auto cached = rateCache_->get(key);
        if (!cached || cached->isExpired(domain::Timestamp::now())) {
            return std::nullopt;
        }
        return *cached;
    }

    void finishFlight(const std::string& key) {
        std::lock_guard<std::mutex> lock(flightsMutex_);
        inFlight_.erase(key);
    }

    void initCache() {
        size_t rateCacheSize = cacheSettings_->getRateCacheSize();
        int rateTtlSeconds = cacheSettings_->getRateTtlSeconds();
        ttl_ = std::chrono::seconds(rateTtlSeconds);

        auto rateBase = std::make_unique<Cache<std::string, domain::ExchangeRate>>(
            rateCacheSize,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(rateTtlSeconds))
        );
        rateCache_ = std::make_unique<ThreadSafeCache<std::string, domain::ExchangeRate>>(
            std::move(rateBase)
        );

        std::cout << "[CachedExchangeRateProvider] Created with:"
                  << " rateCache=" << rateCacheSize << "/" << rateTtlSeconds << "s"
                  << std::endl;
    }

    std::shared_ptr<application::ExchangeRateService> delegate_;
    std::shared_ptr<settings::CacheSettings> cacheSettings_;
    std::unique_ptr<ICache<std::string, domain::ExchangeRate>> rateCache_;
    std::chrono::milliseconds ttl_{0};

    std::mutex flightsMutex_;
    std::unordered_map<std::string, std::shared_future<domain::ExchangeRate>> inFlight_;
};

} // namespace ledger::adapters::secondary
