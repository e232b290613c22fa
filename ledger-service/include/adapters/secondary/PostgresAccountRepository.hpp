#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "adapters/secondary/postgres/LedgerSchema.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища счетов
 *
 * commit() выполняет в одной pqxx::work:
 * - UPDATE ledger_accounts ... WHERE version = <ожидаемая> для каждого счёта
 * - INSERT INTO ledger_transactions
 * Если хоть один UPDATE не затронул строку, транзакция откатывается
 * и бросается VersionConflictError.
 */
class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    std::optional<domain::Account> findById(const std::string& accountId) override {
        return guarded("findById", [&](pqxx::work& txn) -> std::optional<domain::Account> {
            auto result = txn.exec_params(
                std::string("SELECT ") + postgres::ACCOUNT_COLUMNS + " FROM ledger_accounts WHERE account_id = $1",
                accountId);
            if (result.empty()) {
                return std::nullopt;
            }
            return postgres::readAccount(result[0]);
        });
    }

    std::vector<domain::Account> findByOwnerId(const std::string& ownerId) override {
        return guarded("findByOwnerId", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                std::string("SELECT ") + postgres::ACCOUNT_COLUMNS
                    + " FROM ledger_accounts WHERE owner_id = $1 ORDER BY opened_at_ms, account_id",
                ownerId);
            return readAccounts(result);
        });
    }

    std::vector<domain::Account> findAll() override {
        return guarded("findAll", [&](pqxx::work& txn) {
            auto result = txn.exec(
                std::string("SELECT ") + postgres::ACCOUNT_COLUMNS + " FROM ledger_accounts ORDER BY account_id");
            return readAccounts(result);
        });
    }

    void create(const domain::Account& account, const domain::Transaction& opening) override {
        guarded("create", [&](pqxx::work& txn) {
            auto inserted = txn.exec_params(
                "INSERT INTO ledger_accounts "
                "(account_id, owner_id, currency, balance, version, closed, opened_at_ms) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7) "
                "ON CONFLICT (account_id) DO NOTHING RETURNING account_id",
                account.accountId,
                account.ownerId,
                account.currency,
                account.balance.minorUnits,
                static_cast<int64_t>(account.version),
                account.closed,
                account.openedAt.epochMillis());
            if (inserted.empty()) {
                throw std::invalid_argument("Account already exists: " + account.accountId);
            }
            postgres::insertTransaction(txn, opening);
            txn.commit();
        });
        std::cout << "[PostgresAccountRepository] Created " << account.accountId << std::endl;
    }

    void commit(const std::vector<domain::Account>& accounts, const domain::Transaction& record) override {
        guarded("commit", [&](pqxx::work& txn) {
            for (const auto& account : accounts) {
                auto updated = txn.exec_params(
                    "UPDATE ledger_accounts SET balance = $2, version = $3, closed = $4 "
                    "WHERE account_id = $1 AND version = $5",
                    account.accountId,
                    account.balance.minorUnits,
                    static_cast<int64_t>(account.version),
                    account.closed,
                    static_cast<int64_t>(account.version - 1));
                if (updated.affected_rows() != 1) {
                    throw ports::output::VersionConflictError(
                        account.accountId,
                        "Account " + account.accountId + " is no longer at version "
                            + std::to_string(account.version - 1));
                }
            }
            postgres::insertTransaction(txn, record);
            txn.commit();
        });
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    static std::vector<domain::Account> readAccounts(const pqxx::result& result) {
        std::vector<domain::Account> accounts;
        accounts.reserve(result.size());
        for (const auto& row : result) {
            accounts.push_back(postgres::readAccount(row));
        }
        return accounts;
    }

    /**
     * @brief Выполнить fn в новой транзакции и перевести ошибки pqxx в ошибки порта
     *
     * Обрыв соединения и откат по сериализации/дедлоку считаются временными.
     */
    template <typename Fn>
    auto guarded(const char* operation, Fn&& fn) -> decltype(fn(std::declval<pqxx::work&>())) {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            return fn(txn);
        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresAccountRepository] " << operation << " connection error: " << e.what() << std::endl;
            throw ports::output::TransientStoreError(e.what());
        } catch (const pqxx::transaction_rollback& e) {
            std::cerr << "[PostgresAccountRepository] " << operation << " rolled back: " << e.what() << std::endl;
            throw ports::output::TransientStoreError(e.what());
        } catch (const pqxx::in_doubt_error& e) {
            std::cerr << "[PostgresAccountRepository] " << operation << " in doubt: " << e.what() << std::endl;
            throw;
        } catch (const pqxx::sql_error& e) {
            std::cerr << "[PostgresAccountRepository] " << operation << " error: " << e.what() << std::endl;
            throw;
        }
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            postgres::initSchema(txn);
            txn.commit();
            std::cout << "[PostgresAccountRepository] Schema initialized" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace ledger::adapters::secondary
