#pragma once

#include "domain/Account.hpp"
#include "domain/Transaction.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Интерфейс сервиса счетов
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @brief Открыть счёт
     * @param accountId Пустая строка: id будет сгенерирован
     * @param initialBalance Начальный баланс в валюте счёта (записывается как OPENING)
     */
    virtual domain::Account openAccount(
        const std::string& accountId,
        const std::string& ownerId,
        const std::string& currency,
        const domain::Money& initialBalance) = 0;

    /**
     * @brief Закрыть счёт. Баланс замораживается
     */
    virtual domain::Account closeAccount(const std::string& accountId) = 0;

    virtual std::optional<domain::Account> getAccount(const std::string& accountId) = 0;

    virtual std::vector<domain::Account> getOwnerAccounts(const std::string& ownerId) = 0;

    /**
     * @brief Закоммиченные записи по счёту, новые первыми
     * @throws domain::LedgerException ACCOUNT_NOT_FOUND
     */
    virtual std::vector<domain::Transaction> getStatement(const std::string& accountId) = 0;
};

} // namespace ledger::ports::input
