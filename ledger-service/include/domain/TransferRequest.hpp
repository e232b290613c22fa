#pragma once

#include "Money.hpp"
#include <string>
#include <optional>
#include <chrono>
#include <cstdint>

namespace ledger::domain {

using Deadline = std::chrono::steady_clock::time_point;

/**
 * @brief Запрос на перевод между счетами
 *
 * amount задаётся в валюте счёта-источника.
 * deadline ограничивает ожидание до захвата блокировок; после захвата
 * перевод доводится до конца.
 */
struct TransferRequest {
    std::string sourceAccountId;
    std::string destinationAccountId;
    Money amount;
    std::string idempotencyKey;
    std::string description;
    std::optional<Deadline> deadline;
};

/**
 * @brief Запрос на пополнение или списание одного счёта
 *
 * expectedVersion: версия счёта, прочитанная клиентом. Если задана и
 * не совпадает с текущей, операция отклоняется с CONCURRENCY_CONFLICT.
 */
struct BalanceRequest {
    std::string accountId;
    Money amount;
    std::string idempotencyKey;
    std::string description;
    std::optional<uint64_t> expectedVersion;
    std::optional<Deadline> deadline;
};

} // namespace ledger::domain
