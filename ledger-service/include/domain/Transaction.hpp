#pragma once

#include "Money.hpp"
#include "Rate.hpp"
#include "Timestamp.hpp"
#include "enums/TransactionStatus.hpp"
#include "enums/TransactionType.hpp"
#include "enums/RateSource.hpp"
#include "enums/ErrorCode.hpp"
#include <string>
#include <optional>

namespace ledger::domain {

/**
 * @brief Запись журнала: перевод, пополнение, списание, открытие или закрытие счёта
 *
 * Содержит всё, что нужно для восстановления изменения баланса:
 * - debit списывается со source, credit зачисляется на destination
 * - rate и rateSource: реально применённый курс
 * - balance*After: балансы сторон сразу после мутации
 *
 * Для DEPOSIT/OPENING source пустой, для WITHDRAWAL пустой destination.
 * После COMMITTED или FAILED запись неизменяема.
 */
struct Transaction {
    std::string transactionId;
    TransactionType type = TransactionType::TRANSFER;
    std::string idempotencyKey;

    std::string sourceAccountId;
    std::string destinationAccountId;

    Money requested;
    std::optional<Money> debit;
    std::optional<Money> credit;
    Rate rate = Rate::one();
    RateSource rateSource = RateSource::IDENTITY;

    std::optional<Money> sourceBalanceAfter;
    std::optional<Money> destinationBalanceAfter;

    TransactionStatus status = TransactionStatus::PENDING;
    /// Последнее состояние, достигнутое до COMMITTED/FAILED
    TransactionStatus stage = TransactionStatus::PENDING;
    ErrorCode error = ErrorCode::NONE;
    std::string message;
    std::string description;
    Timestamp timestamp;

    bool isCommitted() const {
        return status == TransactionStatus::COMMITTED;
    }

    bool touches(const std::string& accountId) const {
        return sourceAccountId == accountId || destinationAccountId == accountId;
    }

    /**
     * @brief Перевести запись в следующее состояние конвейера
     */
    void advance(TransactionStatus next) {
        status = next;
        stage = next;
    }
};

} // namespace ledger::domain
