#pragma once

#include "ports/output/IAuditLog.hpp"
#include "ports/output/StoreErrors.hpp"
#include "adapters/secondary/postgres/LedgerSchema.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief Журнал транзакций в таблице ledger_transactions
 *
 * Закоммиченные записи вставляет PostgresAccountRepository::commit(),
 * здесь append() пишет только FAILED-записи.
 */
class PostgresAuditLog : public ports::output::IAuditLog {
public:
    explicit PostgresAuditLog(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        pqxx::connection c(settings_->getConnectionString());
        std::cout << "[PostgresAuditLog] Connected to " << settings_->getDatabase() << "@" << settings_->getHost() << std::endl;
    }

    void append(const domain::Transaction& record) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            postgres::insertTransaction(txn, record);
            txn.commit();
        } catch (const pqxx::broken_connection& e) {
            throw ports::output::TransientStoreError(e.what());
        }
    }

    std::optional<domain::Transaction> findCommittedByIdempotencyKey(const std::string& key) override {
        auto result = query(
            std::string("SELECT ") + postgres::TRANSACTION_COLUMNS + " FROM ledger_transactions "
            "WHERE idempotency_key = $1 AND status = 'COMMITTED'",
            key);
        if (result.empty()) {
            return std::nullopt;
        }
        return result.front();
    }

    std::vector<domain::Transaction> findByAccountId(const std::string& accountId) override {
        return query(
            std::string("SELECT ") + postgres::TRANSACTION_COLUMNS + " FROM ledger_transactions "
            "WHERE source_account_id = $1 OR destination_account_id = $1 ORDER BY seq DESC",
            accountId);
    }

    std::vector<domain::Transaction> findAllRecords() override {
        return read("findAllRecords", [](pqxx::work& txn) {
            return txn.exec(
                std::string("SELECT ") + postgres::TRANSACTION_COLUMNS + " FROM ledger_transactions ORDER BY seq");
        });
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    std::vector<domain::Transaction> query(const std::string& sql, const std::string& param) {
        return read("query", [&](pqxx::work& txn) { return txn.exec_params(sql, param); });
    }

    /**
     * @brief Чтение журнала; обрыв соединения и откат транзакции считаются временными
     */
    template <typename Fn>
    std::vector<domain::Transaction> read(const char* operation, Fn&& fn) {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            return readAll(fn(txn));
        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresAuditLog] " << operation << " connection error: " << e.what() << std::endl;
            throw ports::output::TransientStoreError(e.what());
        } catch (const pqxx::transaction_rollback& e) {
            std::cerr << "[PostgresAuditLog] " << operation << " rolled back: " << e.what() << std::endl;
            throw ports::output::TransientStoreError(e.what());
        }
    }

    static std::vector<domain::Transaction> readAll(const pqxx::result& result) {
        std::vector<domain::Transaction> records;
        records.reserve(result.size());
        for (const auto& row : result) {
            records.push_back(postgres::readTransaction(row));
        }
        return records;
    }
};

} // namespace ledger::adapters::secondary
