#pragma once

#include <string>

namespace ledger::domain {

enum class TransactionType {
    OPENING,
    DEPOSIT,
    WITHDRAWAL,
    TRANSFER,
    CLOSURE
};

inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::OPENING: return "OPENING";
        case TransactionType::DEPOSIT: return "DEPOSIT";
        case TransactionType::WITHDRAWAL: return "WITHDRAWAL";
        case TransactionType::TRANSFER: return "TRANSFER";
        case TransactionType::CLOSURE: return "CLOSURE";
        default: return "UNKNOWN";
    }
}

inline TransactionType parseTransactionType(const std::string& str) {
    if (str == "OPENING") return TransactionType::OPENING;
    if (str == "WITHDRAWAL") return TransactionType::WITHDRAWAL;
    if (str == "TRANSFER") return TransactionType::TRANSFER;
    if (str == "CLOSURE") return TransactionType::CLOSURE;
    return TransactionType::DEPOSIT;
}

} // namespace ledger::domain
