#pragma once

#include "Transaction.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Результат перевода
 *
 * Собирается из закоммиченной записи журнала, поэтому повтор по
 * idempotency key возвращает ровно те же значения, что и первый вызов.
 */
struct TransferResult {
    std::string transactionId;
    Money sourceBalance;
    Money destinationBalance;
    Money debit;
    Money credit;
    Rate appliedRate = Rate::one();
    RateSource rateSource = RateSource::IDENTITY;
    bool replayed = false;
    Timestamp timestamp;

    static TransferResult fromTransaction(const Transaction& tx, bool replayed = false) {
        TransferResult r;
        r.transactionId = tx.transactionId;
        r.sourceBalance = tx.sourceBalanceAfter.value_or(Money());
        r.destinationBalance = tx.destinationBalanceAfter.value_or(Money());
        r.debit = tx.debit.value_or(tx.requested);
        r.credit = tx.credit.value_or(tx.requested);
        r.appliedRate = tx.rate;
        r.rateSource = tx.rateSource;
        r.replayed = replayed;
        r.timestamp = tx.timestamp;
        return r;
    }
};

/**
 * @brief Результат пополнения или списания
 */
struct BalanceResult {
    std::string transactionId;
    std::string accountId;
    Money newBalance;
    Money applied;
    Rate appliedRate = Rate::one();
    bool replayed = false;
    Timestamp timestamp;

    static BalanceResult fromTransaction(const Transaction& tx, bool replayed = false) {
        BalanceResult r;
        r.transactionId = tx.transactionId;
        if (tx.type == TransactionType::WITHDRAWAL) {
            r.accountId = tx.sourceAccountId;
            r.newBalance = tx.sourceBalanceAfter.value_or(Money());
            r.applied = tx.debit.value_or(tx.requested);
        } else {
            r.accountId = tx.destinationAccountId;
            r.newBalance = tx.destinationBalanceAfter.value_or(Money());
            r.applied = tx.credit.value_or(tx.requested);
        }
        r.appliedRate = tx.rate;
        r.replayed = replayed;
        r.timestamp = tx.timestamp;
        return r;
    }
};

} // namespace ledger::domain
