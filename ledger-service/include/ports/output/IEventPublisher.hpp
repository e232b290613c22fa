#pragma once

#include <string>

namespace ledger::ports::output {

/**
 * @brief Исходящий порт уведомлений о транзакциях
 *
 * Доставка best-effort: исключение из publish() не откатывает коммит,
 * TransactionService его только логирует.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /// routingKey: transaction.committed | transaction.failed, message: JSON события
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace ledger::ports::output
