#pragma once

#include <string>

namespace ledger::domain {

enum class ErrorCode {
    NONE,
    ACCOUNT_NOT_FOUND,
    ACCOUNT_CLOSED,
    INVALID_TRANSFER,
    INSUFFICIENT_FUNDS,
    RATE_UNAVAILABLE,
    CONCURRENCY_CONFLICT,
    AUDIT_WRITE_FAILURE,
    REQUEST_EXPIRED,
    STORE_UNAVAILABLE   ///< Чтение из хранилища не удалось после всех повторов
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::ACCOUNT_NOT_FOUND: return "ACCOUNT_NOT_FOUND";
        case ErrorCode::ACCOUNT_CLOSED: return "ACCOUNT_CLOSED";
        case ErrorCode::INVALID_TRANSFER: return "INVALID_TRANSFER";
        case ErrorCode::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case ErrorCode::RATE_UNAVAILABLE: return "RATE_UNAVAILABLE";
        case ErrorCode::CONCURRENCY_CONFLICT: return "CONCURRENCY_CONFLICT";
        case ErrorCode::AUDIT_WRITE_FAILURE: return "AUDIT_WRITE_FAILURE";
        case ErrorCode::REQUEST_EXPIRED: return "REQUEST_EXPIRED";
        case ErrorCode::STORE_UNAVAILABLE: return "STORE_UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

inline ErrorCode parseErrorCode(const std::string& str) {
    if (str == "ACCOUNT_NOT_FOUND") return ErrorCode::ACCOUNT_NOT_FOUND;
    if (str == "ACCOUNT_CLOSED") return ErrorCode::ACCOUNT_CLOSED;
    if (str == "INVALID_TRANSFER") return ErrorCode::INVALID_TRANSFER;
    if (str == "INSUFFICIENT_FUNDS") return ErrorCode::INSUFFICIENT_FUNDS;
    if (str == "RATE_UNAVAILABLE") return ErrorCode::RATE_UNAVAILABLE;
    if (str == "CONCURRENCY_CONFLICT") return ErrorCode::CONCURRENCY_CONFLICT;
    if (str == "AUDIT_WRITE_FAILURE") return ErrorCode::AUDIT_WRITE_FAILURE;
    if (str == "REQUEST_EXPIRED") return ErrorCode::REQUEST_EXPIRED;
    if (str == "STORE_UNAVAILABLE") return ErrorCode::STORE_UNAVAILABLE;
    return ErrorCode::NONE;
}

} // namespace ledger::domain
