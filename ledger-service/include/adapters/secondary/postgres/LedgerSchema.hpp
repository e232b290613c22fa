#pragma once

#include "domain/Account.hpp"
#include "domain/Transaction.hpp"
#include <pqxx/pqxx>
#include <optional>
#include <string>

namespace ledger::adapters::secondary::postgres {

/**
 * @brief Схема леджера
 *
 * ledger_accounts:
 * - account_id VARCHAR(64) PRIMARY KEY
 * - owner_id, currency, balance BIGINT (минорные единицы), version BIGINT, closed
 *
 * ledger_transactions (append-only):
 * - seq BIGSERIAL задаёт порядок добавления
 * - суммы хранятся парами <name>_amount BIGINT / <name>_currency
 * - rate_nanos: курс в единицах 1e-9
 * - уникальный индекс по idempotency_key среди COMMITTED записей
 */
inline void initSchema(pqxx::work& txn) {
    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS ledger_accounts (
            account_id VARCHAR(64) PRIMARY KEY,
            owner_id VARCHAR(64) NOT NULL,
            currency VARCHAR(3) NOT NULL,
            balance BIGINT NOT NULL,
            version BIGINT NOT NULL,
            closed BOOLEAN NOT NULL DEFAULT FALSE,
            opened_at_ms BIGINT NOT NULL
        )
    )");
    txn.exec(R"(
        CREATE TABLE IF NOT EXISTS ledger_transactions (
            seq BIGSERIAL,
            transaction_id VARCHAR(64) PRIMARY KEY,
            type VARCHAR(16) NOT NULL,
            status VARCHAR(16) NOT NULL,
            stage VARCHAR(16) NOT NULL,
            error_code VARCHAR(32) NOT NULL DEFAULT 'NONE',
            message TEXT NOT NULL DEFAULT '',
            description TEXT NOT NULL DEFAULT '',
            idempotency_key VARCHAR(128) NOT NULL DEFAULT '',
            source_account_id VARCHAR(64) NOT NULL DEFAULT '',
            destination_account_id VARCHAR(64) NOT NULL DEFAULT '',
            requested_amount BIGINT NOT NULL,
            requested_currency VARCHAR(3) NOT NULL,
            debit_amount BIGINT,
            debit_currency VARCHAR(3),
            credit_amount BIGINT,
            credit_currency VARCHAR(3),
            rate_nanos BIGINT NOT NULL,
            rate_source VARCHAR(16) NOT NULL,
            source_balance_amount BIGINT,
            source_balance_currency VARCHAR(3),
            destination_balance_amount BIGINT,
            destination_balance_currency VARCHAR(3),
            created_at_ms BIGINT NOT NULL
        )
    )");
    txn.exec(R"(
        CREATE UNIQUE INDEX IF NOT EXISTS ux_ledger_transactions_committed_key
        ON ledger_transactions (idempotency_key)
        WHERE status = 'COMMITTED' AND idempotency_key <> ''
    )");
    txn.exec(R"(
        CREATE INDEX IF NOT EXISTS ix_ledger_transactions_source
        ON ledger_transactions (source_account_id)
    )");
    txn.exec(R"(
        CREATE INDEX IF NOT EXISTS ix_ledger_transactions_destination
        ON ledger_transactions (destination_account_id)
    )");
}

inline constexpr const char* ACCOUNT_COLUMNS =
    "account_id, owner_id, currency, balance, version, closed, opened_at_ms";

inline constexpr const char* TRANSACTION_COLUMNS =
    "transaction_id, type, status, stage, error_code, message, description, idempotency_key, "
    "source_account_id, destination_account_id, requested_amount, requested_currency, "
    "debit_amount, debit_currency, credit_amount, credit_currency, rate_nanos, rate_source, "
    "source_balance_amount, source_balance_currency, destination_balance_amount, "
    "destination_balance_currency, created_at_ms";

inline domain::Account readAccount(const pqxx::row& row) {
    domain::Account account;
    account.accountId = row["account_id"].as<std::string>();
    account.ownerId = row["owner_id"].as<std::string>();
    account.currency = row["currency"].as<std::string>();
    account.balance = domain::Money(row["balance"].as<int64_t>(), account.currency);
    account.version = row["version"].as<uint64_t>();
    account.closed = row["closed"].as<bool>();
    account.openedAt = domain::Timestamp::fromEpochMillis(row["opened_at_ms"].as<int64_t>());
    return account;
}

inline std::optional<domain::Money> readMoney(const pqxx::row& row, const std::string& prefix) {
    const auto amount = row[prefix + "_amount"];
    const auto currency = row[prefix + "_currency"];
    if (amount.is_null() || currency.is_null()) {
        return std::nullopt;
    }
    return domain::Money(amount.as<int64_t>(), currency.as<std::string>());
}

inline domain::Transaction readTransaction(const pqxx::row& row) {
    domain::Transaction tx;
    tx.transactionId = row["transaction_id"].as<std::string>();
    tx.type = domain::parseTransactionType(row["type"].as<std::string>());
    tx.status = domain::parseTransactionStatus(row["status"].as<std::string>());
    tx.stage = domain::parseTransactionStatus(row["stage"].as<std::string>());
    tx.error = domain::parseErrorCode(row["error_code"].as<std::string>());
    tx.message = row["message"].as<std::string>();
    tx.description = row["description"].as<std::string>();
    tx.idempotencyKey = row["idempotency_key"].as<std::string>();
    tx.sourceAccountId = row["source_account_id"].as<std::string>();
    tx.destinationAccountId = row["destination_account_id"].as<std::string>();
    tx.requested = domain::Money(row["requested_amount"].as<int64_t>(), row["requested_currency"].as<std::string>());
    tx.debit = readMoney(row, "debit");
    tx.credit = readMoney(row, "credit");
    tx.rate = domain::Rate::fromNanos(row["rate_nanos"].as<int64_t>());
    tx.rateSource = domain::parseRateSource(row["rate_source"].as<std::string>());
    tx.sourceBalanceAfter = readMoney(row, "source_balance");
    tx.destinationBalanceAfter = readMoney(row, "destination_balance");
    tx.timestamp = domain::Timestamp::fromEpochMillis(row["created_at_ms"].as<int64_t>());
    return tx;
}

inline std::optional<int64_t> amountOf(const std::optional<domain::Money>& money) {
    if (!money) return std::nullopt;
    return money->minorUnits;
}

inline std::optional<std::string> currencyOf(const std::optional<domain::Money>& money) {
    if (!money) return std::nullopt;
    return money->currency;
}

inline void insertTransaction(pqxx::work& txn, const domain::Transaction& tx) {
    txn.exec_params(
        std::string("INSERT INTO ledger_transactions (") + TRANSACTION_COLUMNS + ") VALUES "
        "($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, $17, $18, "
        "$19, $20, $21, $22, $23)",
        tx.transactionId,
        domain::toString(tx.type),
        domain::toString(tx.status),
        domain::toString(tx.stage),
        domain::toString(tx.error),
        tx.message,
        tx.description,
        tx.idempotencyKey,
        tx.sourceAccountId,
        tx.destinationAccountId,
        tx.requested.minorUnits,
        tx.requested.currency,
        amountOf(tx.debit),
        currencyOf(tx.debit),
        amountOf(tx.credit),
        currencyOf(tx.credit),
        tx.rate.totalNanos(),
        domain::toString(tx.rateSource),
        amountOf(tx.sourceBalanceAfter),
        currencyOf(tx.sourceBalanceAfter),
        amountOf(tx.destinationBalanceAfter),
        currencyOf(tx.destinationBalanceAfter),
        tx.timestamp.epochMillis());
}

} // namespace ledger::adapters::secondary::postgres
