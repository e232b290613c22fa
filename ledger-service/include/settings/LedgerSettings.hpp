#pragma once

#include <cstdlib>
#include <string>

namespace ledger::settings {

/**
 * @brief Настройки движка транзакций
 *
 * Читает из ENV:
 * - LEDGER_STORE_RETRY_ATTEMPTS (default: 3) - попыток записи при временном сбое хранилища
 * - LEDGER_STORE_RETRY_BACKOFF_MS (default: 20) - пауза перед первым повтором, дальше удваивается
 * - LEDGER_LOCK_TIMEOUT_MS (default: 5000) - дедлайн захвата блокировок, если запрос его не задал
 */
class LedgerSettings {
public:
    LedgerSettings() {
        if (const char* val = std::getenv("LEDGER_STORE_RETRY_ATTEMPTS")) {
            storeRetryAttempts_ = std::stoi(val);
        }
        if (const char* val = std::getenv("LEDGER_STORE_RETRY_BACKOFF_MS")) {
            storeRetryBackoffMs_ = std::stoi(val);
        }
        if (const char* val = std::getenv("LEDGER_LOCK_TIMEOUT_MS")) {
            lockTimeoutMs_ = std::stoi(val);
        }
    }

    int getStoreRetryAttempts() const { return storeRetryAttempts_; }
    int getStoreRetryBackoffMs() const { return storeRetryBackoffMs_; }
    int getLockTimeoutMs() const { return lockTimeoutMs_; }

    void setStoreRetryAttempts(int attempts) { storeRetryAttempts_ = attempts; }
    void setStoreRetryBackoffMs(int ms) { storeRetryBackoffMs_ = ms; }
    void setLockTimeoutMs(int ms) { lockTimeoutMs_ = ms; }

private:
    int storeRetryAttempts_ = 3;
    int storeRetryBackoffMs_ = 20;
    int lockTimeoutMs_ = 5000;
};

} // namespace ledger::settings
