#pragma once

#include "domain/TransferRequest.hpp"
#include "domain/TransactionResult.hpp"

namespace ledger::ports::input {

/**
 * @brief Движок транзакций
 *
 * Все операции либо коммитятся целиком, либо бросают domain::LedgerException,
 * не меняя ни одного баланса.
 */
class ITransactionService {
public:
    virtual ~ITransactionService() = default;

    virtual domain::BalanceResult deposit(const domain::BalanceRequest& request) = 0;

    virtual domain::BalanceResult withdraw(const domain::BalanceRequest& request) = 0;

    /**
     * @brief Перевод между счетами, в том числе в разных валютах
     *
     * Повтор с тем же idempotencyKey после успешного коммита возвращает
     * исходный результат (replayed = true) без повторного движения денег.
     */
    virtual domain::TransferResult transfer(const domain::TransferRequest& request) = 0;
};

} // namespace ledger::ports::input
