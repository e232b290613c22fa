#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IAuditLog.hpp"
#include "application/AccountLedger.hpp"
#include "domain/Currency.hpp"
#include "domain/LedgerException.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>

namespace ledger::application {

/**
 * @brief Сервис счетов: открытие, закрытие, чтение, выписка
 *
 * Открытие пишет запись OPENING с начальным балансом, закрытие запись
 * CLOSURE. Благодаря этому баланс любого счёта восстанавливается
 * проигрыванием журнала с нуля (см. LedgerReconciler).
 */
class AccountService : public ports::input::IAccountService {
public:
    AccountService(
        std::shared_ptr<ports::output::IAccountRepository> accounts,
        std::shared_ptr<ports::output::IAuditLog> auditLog,
        std::shared_ptr<AccountLedger> ledger
    ) : accounts_(std::move(accounts))
      , auditLog_(std::move(auditLog))
      , ledger_(std::move(ledger))
      , rng_(std::random_device{}())
    {
        std::cout << "[AccountService] Created" << std::endl;
    }

    domain::Account openAccount(
        const std::string& accountId,
        const std::string& ownerId,
        const std::string& currency,
        const domain::Money& initialBalance) override
    {
        if (!domain::isSupportedCurrency(currency)) {
            throw domain::LedgerException(
                domain::ErrorCode::INVALID_TRANSFER, "Unsupported currency: " + currency, accountId);
        }
        if (initialBalance.currency != currency || initialBalance.isNegative()) {
            throw domain::LedgerException(
                domain::ErrorCode::INVALID_TRANSFER,
                "Initial balance must be non-negative and in " + currency, accountId, initialBalance);
        }

        domain::Account account;
        account.accountId = accountId.empty() ? generateId("acc-") : accountId;
        account.ownerId = ownerId;
        account.currency = currency;
        account.balance = initialBalance;
        account.version = 1;
        account.openedAt = domain::Timestamp::now();

        domain::Transaction opening;
        opening.transactionId = generateId("tx-");
        opening.type = domain::TransactionType::OPENING;
        opening.destinationAccountId = account.accountId;
        opening.requested = initialBalance;
        opening.credit = initialBalance;
        opening.destinationBalanceAfter = initialBalance;
        opening.advance(domain::TransactionStatus::COMMITTED);
        opening.timestamp = account.openedAt;

        try {
            accounts_->create(account, opening);
        } catch (const std::invalid_argument& e) {
            throw domain::LedgerException(
                domain::ErrorCode::INVALID_TRANSFER, e.what(), account.accountId);
        } catch (const ports::output::TransientStoreError& e) {
            throw domain::LedgerException(
                domain::ErrorCode::AUDIT_WRITE_FAILURE, e.what(), account.accountId);
        }

        std::cout << "[AccountService] Opened " << account.accountId << " (" << currency
                  << ") for " << ownerId << " with " << initialBalance.toString() << std::endl;
        return account;
    }

    domain::Account closeAccount(const std::string& accountId) override {
        auto current = ledger_->load(accountId);
        if (current.closed) {
            throw domain::LedgerException(
                domain::ErrorCode::ACCOUNT_CLOSED, "Account is already closed: " + accountId, accountId);
        }

        auto locks = ledger_->acquire({accountId});

        domain::Transaction closure;
        closure.transactionId = generateId("tx-");
        closure.type = domain::TransactionType::CLOSURE;
        closure.sourceAccountId = accountId;
        closure.requested = current.balance;
        closure.advance(domain::TransactionStatus::LOCKED);

        auto closed = ledger_->close(locks, accountId, closure);
        std::cout << "[AccountService] Closed " << accountId
                  << " with frozen balance " << closed.balance.toString() << std::endl;
        return closed;
    }

    std::optional<domain::Account> getAccount(const std::string& accountId) override {
        return ledger_->withStoreRetry(
            "findById", accountId, domain::TransactionStatus::PENDING, domain::ErrorCode::STORE_UNAVAILABLE,
            [&]() { return accounts_->findById(accountId); });
    }

    std::vector<domain::Account> getOwnerAccounts(const std::string& ownerId) override {
        return ledger_->withStoreRetry(
            "findByOwnerId", "", domain::TransactionStatus::PENDING, domain::ErrorCode::STORE_UNAVAILABLE,
            [&]() { return accounts_->findByOwnerId(ownerId); });
    }

    std::vector<domain::Transaction> getStatement(const std::string& accountId) override {
        ledger_->load(accountId);

        auto records = ledger_->withStoreRetry(
            "findByAccountId", accountId, domain::TransactionStatus::PENDING, domain::ErrorCode::STORE_UNAVAILABLE,
            [&]() { return auditLog_->findByAccountId(accountId); });
        records.erase(
            std::remove_if(records.begin(), records.end(),
                           [](const domain::Transaction& tx) { return !tx.isCommitted(); }),
            records.end());
        return records;
    }

private:
    std::shared_ptr<ports::output::IAccountRepository> accounts_;
    std::shared_ptr<ports::output::IAuditLog> auditLog_;
    std::shared_ptr<AccountLedger> ledger_;

    std::mutex rngMutex_;
    std::mt19937_64 rng_;

    std::string generateId(const std::string& prefix) {
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(rngMutex_);
            id = rng_();
        }

        std::stringstream ss;
        ss << prefix << std::hex << std::setfill('0') << std::setw(16) << id;
        return ss.str();
    }
};

} // namespace ledger::application
