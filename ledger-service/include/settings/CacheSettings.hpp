#pragma once

#include <cstdlib>
#include <cstddef>
#include <string>

namespace ledger::settings {

/**
 * @brief Настройки кэша курсов
 *
 * Читает из ENV:
 * - CACHE_RATE_SIZE (default: 256)
 * - CACHE_RATE_TTL_SECONDS (default: 30)
 */
class CacheSettings {
public:
    CacheSettings() {
        if (const char* val = std::getenv("CACHE_RATE_SIZE")) {
            rateCacheSize_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("CACHE_RATE_TTL_SECONDS")) {
            rateTtlSeconds_ = std::stoi(val);
        }
    }

    size_t getRateCacheSize() const { return rateCacheSize_; }
    int getRateTtlSeconds() const { return rateTtlSeconds_; }

    void setRateCacheSize(size_t size) { rateCacheSize_ = size; }
    void setRateTtlSeconds(int seconds) { rateTtlSeconds_ = seconds; }

private:
    size_t rateCacheSize_ = 256;
    int rateTtlSeconds_ = 30;
};

} // namespace ledger::settings
