#pragma once

#include <stdexcept>
#include <string>

namespace ledger::ports::output {

/**
 * @brief Временный сбой хранилища (обрыв соединения, serialization failure)
 *
 * Операцию можно повторить: хранилище гарантирует, что неудачная запись
 * не оставила частичных изменений.
 */
class TransientStoreError : public std::runtime_error {
public:
    explicit TransientStoreError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Версия счёта в хранилище не совпала с ожидаемой
 *
 * Кто-то изменил счёт в обход блокировки этого процесса.
 */
class VersionConflictError : public std::runtime_error {
public:
    VersionConflictError(const std::string& accountId, const std::string& message)
        : std::runtime_error(message), accountId_(accountId) {}

    const std::string& accountId() const { return accountId_; }

private:
    std::string accountId_;
};

} // namespace ledger::ports::output
