#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IAuditLog.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace ledger::tests {

/**
 * @brief Хранилище счетов и журнала в памяти
 *
 * Реализует оба порта над одним состоянием, чтобы commit() был атомарным
 * так же, как транзакция PostgreSQL. Умеет имитировать сбои:
 * - failNextCommits(n): n временных сбоев подряд (TransientStoreError)
 * - failCommitsPermanently(): любой commit() падает с runtime_error
 * - failAppends(): append() FAILED-записей падает
 * - failNextReads(n): n временных сбоев findById()
 * - failNextLookups(n): n временных сбоев поиска по idempotency key
 */
class InMemoryLedgerStore : public ports::output::IAccountRepository,
                            public ports::output::IAuditLog {
public:
    // IAccountRepository

    std::optional<domain::Account> findById(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++readCalls_;
        if (transientReads_ > 0) {
            --transientReads_;
            throw ports::output::TransientStoreError("connection reset");
        }
        auto it = accounts_.find(accountId);
        if (it == accounts_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<domain::Account> findByOwnerId(const std::string& ownerId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Account> result;
        for (const auto& [id, account] : accounts_) {
            if (account.ownerId == ownerId) {
                result.push_back(account);
            }
        }
        return result;
    }

    std::vector<domain::Account> findAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Account> result;
        for (const auto& [id, account] : accounts_) {
            result.push_back(account);
        }
        return result;
    }

    void create(const domain::Account& account, const domain::Transaction& opening) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (accounts_.count(account.accountId) > 0) {
            throw std::invalid_argument("Account already exists: " + account.accountId);
        }
        accounts_[account.accountId] = account;
        journal_.push_back(opening);
    }

    void commit(const std::vector<domain::Account>& accounts, const domain::Transaction& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++commitCalls_;

        if (permanentFailure_) {
            throw std::runtime_error("disk full");
        }
        if (transientFailures_ > 0) {
            --transientFailures_;
            throw ports::output::TransientStoreError("connection reset");
        }

        for (const auto& account : accounts) {
            auto it = accounts_.find(account.accountId);
            if (it == accounts_.end() || it->second.version + 1 != account.version) {
                throw ports::output::VersionConflictError(account.accountId, "stale version for " + account.accountId);
            }
        }
        for (const auto& account : accounts) {
            accounts_[account.accountId] = account;
        }
        journal_.push_back(record);
    }

    // IAuditLog

    void append(const domain::Transaction& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failAppends_) {
            throw std::runtime_error("journal unavailable");
        }
        journal_.push_back(record);
    }

    std::optional<domain::Transaction> findCommittedByIdempotencyKey(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (transientLookups_ > 0) {
            --transientLookups_;
            throw ports::output::TransientStoreError("journal connection reset");
        }
        for (const auto& tx : journal_) {
            if (tx.isCommitted() && !key.empty() && tx.idempotencyKey == key) {
                return tx;
            }
        }
        return std::nullopt;
    }

    std::vector<domain::Transaction> findByAccountId(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Transaction> result;
        for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
            if (it->touches(accountId)) {
                result.push_back(*it);
            }
        }
        return result;
    }

    std::vector<domain::Transaction> findAllRecords() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return journal_;
    }

    // Тестовые хелперы

    domain::Account seed(const std::string& accountId, const std::string& currency,
                         const std::string& balance, const std::string& ownerId = "owner-1") {
        domain::Account account;
        account.accountId = accountId;
        account.ownerId = ownerId;
        account.currency = currency;
        account.balance = domain::Money::fromString(balance, currency);
        account.version = 1;

        domain::Transaction opening;
        opening.transactionId = "tx-open-" + accountId;
        opening.type = domain::TransactionType::OPENING;
        opening.destinationAccountId = accountId;
        opening.requested = account.balance;
        opening.credit = account.balance;
        opening.destinationBalanceAfter = account.balance;
        opening.advance(domain::TransactionStatus::COMMITTED);

        create(account, opening);
        return account;
    }

    domain::Money balanceOf(const std::string& accountId) {
        std::lock_guard<std::mutex> lock(mutex_);
        return accounts_.at(accountId).balance;
    }

    /// Изменить баланс в обход журнала (для тестов сверки)
    void tamper(const std::string& accountId, const domain::Money& balance) {
        std::lock_guard<std::mutex> lock(mutex_);
        accounts_.at(accountId).balance = balance;
    }

    std::vector<domain::Transaction> journal() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return journal_;
    }

    size_t committedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::count_if(journal_.begin(), journal_.end(),
                             [](const domain::Transaction& tx) { return tx.isCommitted(); });
    }

    size_t failedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::count_if(journal_.begin(), journal_.end(), [](const domain::Transaction& tx) {
            return tx.status == domain::TransactionStatus::FAILED;
        });
    }

    int commitCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commitCalls_;
    }

    void failNextCommits(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        transientFailures_ = count;
    }

    void failCommitsPermanently(bool fail = true) {
        std::lock_guard<std::mutex> lock(mutex_);
        permanentFailure_ = fail;
    }

    void failNextReads(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        transientReads_ = count;
    }

    void failNextLookups(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        transientLookups_ = count;
    }

    int readCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return readCalls_;
    }

    void failAppends(bool fail = true) {
        std::lock_guard<std::mutex> lock(mutex_);
        failAppends_ = fail;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, domain::Account> accounts_;
    std::vector<domain::Transaction> journal_;

    int transientFailures_ = 0;
    bool permanentFailure_ = false;
    bool failAppends_ = false;
    int commitCalls_ = 0;
    int transientReads_ = 0;
    int transientLookups_ = 0;
    int readCalls_ = 0;
};

} // namespace ledger::tests
