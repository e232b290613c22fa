#pragma once

#include <string>

namespace ledger::domain {

/**
 * @brief Состояние транзакции
 *
 * PENDING -> RATE_RESOLVED (только кросс-валютные) -> LOCKED -> COMMITTED
 * Из любого состояния до COMMITTED возможен переход в FAILED.
 */
enum class TransactionStatus {
    PENDING,
    RATE_RESOLVED,
    LOCKED,
    COMMITTED,
    FAILED
};

inline std::string toString(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::PENDING: return "PENDING";
        case TransactionStatus::RATE_RESOLVED: return "RATE_RESOLVED";
        case TransactionStatus::LOCKED: return "LOCKED";
        case TransactionStatus::COMMITTED: return "COMMITTED";
        case TransactionStatus::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

inline TransactionStatus parseTransactionStatus(const std::string& str) {
    if (str == "RATE_RESOLVED") return TransactionStatus::RATE_RESOLVED;
    if (str == "LOCKED") return TransactionStatus::LOCKED;
    if (str == "COMMITTED") return TransactionStatus::COMMITTED;
    if (str == "FAILED") return TransactionStatus::FAILED;
    return TransactionStatus::PENDING;
}

} // namespace ledger::domain
