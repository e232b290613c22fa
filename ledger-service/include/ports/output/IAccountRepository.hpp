#pragma once

#include "domain/Account.hpp"
#include "domain/Transaction.hpp"
#include "ports/output/StoreErrors.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Долговременное хранилище счетов
 *
 * Ключевая операция: commit(): атомарно обновить счета и дописать запись
 * в журнал. Либо применяется всё, либо ничего.
 *
 * @example
 * ```cpp
 * auto next = source.withBalance(source.balance - debit);   // version + 1
 * repo->commit({next}, record);  // UPDATE ... WHERE version = next.version - 1
 *                                // + INSERT INTO ledger_transactions
 * ```
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    virtual std::optional<domain::Account> findById(const std::string& accountId) = 0;

    virtual std::vector<domain::Account> findByOwnerId(const std::string& ownerId) = 0;

    virtual std::vector<domain::Account> findAll() = 0;

    /**
     * @brief Создать счёт вместе с записью OPENING
     * @throws std::invalid_argument если счёт с таким id уже есть
     */
    virtual void create(const domain::Account& account, const domain::Transaction& opening) = 0;

    /**
     * @brief Атомарно сохранить новые состояния счетов и запись журнала
     *
     * Для каждого счёта хранимая версия должна быть равна account.version - 1.
     *
     * @throws VersionConflictError если версия не совпала (ничего не записано)
     * @throws TransientStoreError при временном сбое (ничего не записано)
     */
    virtual void commit(const std::vector<domain::Account>& accounts, const domain::Transaction& record) = 0;
};

} // namespace ledger::ports::output
