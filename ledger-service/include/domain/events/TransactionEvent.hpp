#pragma once

#include "DomainEvent.hpp"
#include "domain/Transaction.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ledger::domain {

/**
 * @brief JSON-представление записи журнала
 *
 * Суммы сериализуются строками ("10100.00"), курс строкой ("0.85"),
 * чтобы потребитель не терял точность на double.
 */
nlohmann::json transactionToJson(const Transaction& tx);

/**
 * @brief Событие: транзакция закоммичена или отклонена
 *
 * Потребитель: сервис уведомлений (письма отправителю и получателю).
 */
struct TransactionEvent : public DomainEvent {
    Transaction transaction;

    explicit TransactionEvent(const Transaction& tx)
        : DomainEvent(tx.isCommitted() ? "transaction.committed" : "transaction.failed", tx.transactionId)
        , transaction(tx) {}

    std::string toJson() const override;
};

} // namespace ledger::domain
