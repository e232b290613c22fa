#pragma once

#include "domain/Transaction.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::output {

/**
 * @brief Журнал транзакций (append-only)
 *
 * Закоммиченные записи попадают сюда через IAccountRepository::commit()
 * в одной транзакции с изменением балансов. Напрямую append() пишет
 * только FAILED-записи.
 */
class IAuditLog {
public:
    virtual ~IAuditLog() = default;

    virtual void append(const domain::Transaction& record) = 0;

    /**
     * @brief Закоммиченная запись с данным idempotency key
     */
    virtual std::optional<domain::Transaction> findCommittedByIdempotencyKey(const std::string& key) = 0;

    /**
     * @brief Все записи по счёту, новые первыми
     */
    virtual std::vector<domain::Transaction> findByAccountId(const std::string& accountId) = 0;

    /**
     * @brief Все записи в порядке добавления
     */
    virtual std::vector<domain::Transaction> findAllRecords() = 0;
};

} // namespace ledger::ports::output
