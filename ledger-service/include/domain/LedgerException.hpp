#pragma once

#include "Money.hpp"
#include "enums/ErrorCode.hpp"
#include "enums/TransactionStatus.hpp"
#include <stdexcept>
#include <string>
#include <optional>

namespace ledger::domain {

/**
 * @brief Ошибка операции леджера
 *
 * Несёт код из таксономии ErrorCode и контекст для вызывающей стороны:
 * счёт, запрошенную сумму и достигнутую стадию конвейера.
 */
class LedgerException : public std::runtime_error {
public:
    LedgerException(ErrorCode code,
                    const std::string& message,
                    std::string accountId = "",
                    std::optional<Money> amount = std::nullopt,
                    TransactionStatus stage = TransactionStatus::PENDING)
        : std::runtime_error(message)
        , code_(code)
        , accountId_(std::move(accountId))
        , amount_(std::move(amount))
        , stage_(stage) {}

    ErrorCode code() const { return code_; }
    const std::string& accountId() const { return accountId_; }
    const std::optional<Money>& amount() const { return amount_; }
    TransactionStatus stage() const { return stage_; }

    LedgerException atStage(TransactionStatus stage) const {
        return LedgerException(code_, what(), accountId_, amount_, stage);
    }

private:
    ErrorCode code_;
    std::string accountId_;
    std::optional<Money> amount_;
    TransactionStatus stage_;
};

} // namespace ledger::domain
