#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Счёт в леджере
 *
 * Валюта фиксируется при открытии. Баланс никогда не уходит в минус
 * (овердрафт запрещён). version увеличивается на каждую успешную мутацию
 * и служит для обнаружения устаревших чтений (optimistic concurrency).
 * Счёт не удаляется: закрытый счёт заморожен вместе с балансом.
 */
struct Account {
    std::string accountId;
    std::string ownerId;
    std::string currency = "USD";
    Money balance;
    uint64_t version = 0;
    bool closed = false;
    Timestamp openedAt;

    bool canDebit(const Money& amount) const {
        return balance >= amount;
    }

    /**
     * @brief Копия счёта с новым балансом и следующей версией
     */
    Account withBalance(const Money& newBalance) const {
        Account next = *this;
        next.balance = newBalance;
        next.version = version + 1;
        return next;
    }
};

} // namespace ledger::domain
