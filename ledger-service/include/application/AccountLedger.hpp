#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/Account.hpp"
#include "domain/Transaction.hpp"
#include "domain/TransferRequest.hpp"
#include "domain/LedgerException.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ledger::application {

/**
 * @brief Леджер счетов: блокировки по счёту и атомарные мутации балансов
 *
 * Единица взаимного исключения: счёт. Реестр блокировок хранит по одному
 * std::timed_mutex на счёт, глобальной блокировки нет. Несколько счетов
 * захватываются строго по возрастанию id, поэтому встречные переводы
 * A->B и B->A не могут взаимно заблокироваться.
 *
 * Мутации (deposit, withdraw, transferLocked, close) принимают AccountLocks
 * как доказательство, что вызывающий держит блокировки нужных счетов.
 * Каждая мутация пишет новые балансы и запись журнала одним commit() хранилища.
 */
class AccountLedger {
public:
    /**
     * @brief Захваченные блокировки счетов (RAII)
     *
     * Освобождаются в деструкторе в обратном порядке.
     */
    class AccountLocks {
    public:
        AccountLocks() = default;
        AccountLocks(AccountLocks&&) = default;
        AccountLocks& operator=(AccountLocks&&) = default;

        ~AccountLocks() {
            while (!locks_.empty()) {
                locks_.pop_back();
            }
        }

        bool holds(const std::string& accountId) const {
            return std::find(ids_.begin(), ids_.end(), accountId) != ids_.end();
        }

        const std::vector<std::string>& accountIds() const { return ids_; }

    private:
        friend class AccountLedger;

        std::vector<std::string> ids_;
        std::vector<std::unique_lock<std::timed_mutex>> locks_;
    };

    AccountLedger(
        std::shared_ptr<ports::output::IAccountRepository> accounts,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : accounts_(std::move(accounts))
      , settings_(std::move(settings))
    {
        std::cout << "[AccountLedger] Created: storeRetries=" << settings_->getStoreRetryAttempts()
                  << " backoff=" << settings_->getStoreRetryBackoffMs() << "ms"
                  << " lockTimeout=" << settings_->getLockTimeoutMs() << "ms" << std::endl;
    }

    /**
     * @brief Захватить блокировки счетов в порядке возрастания id
     *
     * Повторяющиеся id схлопываются. Если дедлайн не задан, используется
     * LEDGER_LOCK_TIMEOUT_MS от текущего момента.
     *
     * @throws domain::LedgerException REQUEST_EXPIRED если дедлайн истёк
     *         до захвата всех блокировок (захваченные к этому моменту отпускаются)
     */
    AccountLocks acquire(std::vector<std::string> accountIds, std::optional<domain::Deadline> deadline = std::nullopt) {
        std::sort(accountIds.begin(), accountIds.end());
        accountIds.erase(std::unique(accountIds.begin(), accountIds.end()), accountIds.end());

        auto until = deadline.value_or(
            std::chrono::steady_clock::now() + std::chrono::milliseconds(settings_->getLockTimeoutMs()));

        AccountLocks result;
        for (const auto& id : accountIds) {
            auto mutex = lockRegistry_.getOrCreate(id);
            std::unique_lock<std::timed_mutex> lock(*mutex, std::defer_lock);
            if (!lock.try_lock_until(until)) {
                throw domain::LedgerException(
                    domain::ErrorCode::REQUEST_EXPIRED,
                    "Deadline passed while waiting for account lock " + id,
                    id, std::nullopt, domain::TransactionStatus::RATE_RESOLVED);
            }
            result.locks_.push_back(std::move(lock));
            result.ids_.push_back(id);
        }
        return result;
    }

    /**
     * @brief Вызов хранилища с повтором временных сбоев
     *
     * TransientStoreError повторяется до LEDGER_STORE_RETRY_ATTEMPTS раз,
     * пауза удваивается. После последней попытки бросается LedgerException
     * с кодом exhausted, счётом accountId и стадией stage.
     * Остальные исключения fn пробрасываются как есть.
     */
    template <typename Fn>
    auto withStoreRetry(const char* operation,
                        const std::string& accountId,
                        domain::TransactionStatus stage,
                        domain::ErrorCode exhausted,
                        Fn&& fn) const -> decltype(fn())
    {
        const int attempts = std::max(1, settings_->getStoreRetryAttempts());
        auto backoff = std::chrono::milliseconds(settings_->getStoreRetryBackoffMs());

        for (int attempt = 1;; ++attempt) {
            try {
                return fn();
            } catch (const ports::output::TransientStoreError& e) {
                if (attempt >= attempts) {
                    throw domain::LedgerException(
                        exhausted,
                        std::string("Store unavailable for ") + operation + " after "
                            + std::to_string(attempts) + " attempts: " + e.what(),
                        accountId, std::nullopt, stage);
                }
                std::cerr << "[AccountLedger] " << operation << " transient store error (attempt "
                          << attempt << "/" << attempts << "): " << e.what() << std::endl;
                std::this_thread::sleep_for(backoff);
                backoff *= 2;
            }
        }
    }

    /**
     * @brief Прочитать счёт без блокировки
     * @throws domain::LedgerException ACCOUNT_NOT_FOUND,
     *         STORE_UNAVAILABLE если хранилище не ответило за все попытки
     */
    domain::Account load(const std::string& accountId) const {
        auto account = withStoreRetry("findById", accountId, domain::TransactionStatus::PENDING,
                                      domain::ErrorCode::STORE_UNAVAILABLE,
                                      [&]() { return accounts_->findById(accountId); });
        if (!account) {
            throw domain::LedgerException(
                domain::ErrorCode::ACCOUNT_NOT_FOUND,
                "Account not found: " + accountId, accountId);
        }
        return *account;
    }

    /**
     * @brief Зачислить amount (в валюте счёта) и закоммитить запись record
     *
     * При успехе record получает статус COMMITTED и баланс после зачисления.
     * @return Новый баланс
     */
    domain::Money deposit(
        const AccountLocks& locks,
        const std::string& accountId,
        const domain::Money& amount,
        domain::Transaction& record,
        std::optional<uint64_t> expectedVersion = std::nullopt)
    {
        requireHeld(locks, accountId);
        auto account = loadOpen(accountId);
        requireAmount(account, amount);
        requireVersion(account, expectedVersion);

        auto next = account.withBalance(shifted(account, amount, true));

        auto committed = record;
        committed.destinationBalanceAfter = next.balance;
        commit({next}, committed);
        record = committed;
        return next.balance;
    }

    /**
     * @brief Списать amount (в валюте счёта) и закоммитить запись record
     * @throws domain::LedgerException INSUFFICIENT_FUNDS если баланс меньше amount
     */
    domain::Money withdraw(
        const AccountLocks& locks,
        const std::string& accountId,
        const domain::Money& amount,
        domain::Transaction& record,
        std::optional<uint64_t> expectedVersion = std::nullopt)
    {
        requireHeld(locks, accountId);
        auto account = loadOpen(accountId);
        requireAmount(account, amount);
        requireVersion(account, expectedVersion);
        requireFunds(account, amount);

        auto next = account.withBalance(shifted(account, amount, false));

        auto committed = record;
        committed.sourceBalanceAfter = next.balance;
        commit({next}, committed);
        record = committed;
        return next.balance;
    }

    /**
     * @brief Списать debit с source и зачислить credit на destination
     *
     * Только под блокировками обоих счетов. Обе суммы неотрицательны,
     * каждая в валюте своего счёта. Обе стороны и запись журнала уходят
     * в хранилище одним commit(): либо видны все три изменения, либо ни одно.
     *
     * @return Пара новых балансов {source, destination}
     */
    std::pair<domain::Money, domain::Money> transferLocked(
        const AccountLocks& locks,
        const std::string& sourceId,
        const std::string& destinationId,
        const domain::Money& debit,
        const domain::Money& credit,
        domain::Transaction& record)
    {
        requireHeld(locks, sourceId);
        requireHeld(locks, destinationId);
        if (sourceId == destinationId) {
            throw domain::LedgerException(
                domain::ErrorCode::INVALID_TRANSFER,
                "Cannot transfer to the same account", sourceId, debit,
                domain::TransactionStatus::LOCKED);
        }

        auto source = loadOpen(sourceId);
        auto destination = loadOpen(destinationId);
        if (debit.isNegative() || credit.isNegative()
            || debit.currency != source.currency || credit.currency != destination.currency) {
            throw domain::LedgerException(
                domain::ErrorCode::INVALID_TRANSFER,
                "Transfer amounts do not match account currencies", sourceId, debit,
                domain::TransactionStatus::LOCKED);
        }
        requireFunds(source, debit);

        auto nextSource = source.withBalance(shifted(source, debit, false));
        auto nextDestination = destination.withBalance(shifted(destination, credit, true));

        auto committed = record;
        committed.sourceBalanceAfter = nextSource.balance;
        committed.destinationBalanceAfter = nextDestination.balance;
        commit({nextSource, nextDestination}, committed);
        record = committed;
        return {nextSource.balance, nextDestination.balance};
    }

    /**
     * @brief Закрыть счёт. Баланс замораживается, запись CLOSURE уходит в журнал
     */
    domain::Account close(const AccountLocks& locks, const std::string& accountId, domain::Transaction& record) {
        requireHeld(locks, accountId);
        auto account = loadOpen(accountId);

        auto next = account.withBalance(account.balance);
        next.closed = true;

        auto committed = record;
        committed.sourceBalanceAfter = next.balance;
        commit({next}, committed);
        record = committed;
        return next;
    }

    size_t lockCount() const {
        return lockRegistry_.size();
    }

private:
    void requireHeld(const AccountLocks& locks, const std::string& accountId) const {
        if (!locks.holds(accountId)) {
            throw std::logic_error("Account " + accountId + " is not locked by the caller");
        }
    }

    domain::Account loadOpen(const std::string& accountId) const {
        auto account = withStoreRetry("findById", accountId, domain::TransactionStatus::LOCKED,
                                      domain::ErrorCode::STORE_UNAVAILABLE,
                                      [&]() { return accounts_->findById(accountId); });
        if (!account) {
            throw domain::LedgerException(
                domain::ErrorCode::ACCOUNT_NOT_FOUND,
                "Account not found: " + accountId, accountId, std::nullopt,
                domain::TransactionStatus::LOCKED);
        }
        if (account->closed) {
            throw domain::LedgerException(
                domain::ErrorCode::ACCOUNT_CLOSED,
                "Account is closed: " + accountId, accountId, std::nullopt,
                domain::TransactionStatus::LOCKED);
        }
        return *account;
    }

    static void requireAmount(const domain::Account& account, const domain::Money& amount) {
        if (!amount.isPositive() || amount.currency != account.currency) {
            throw domain::LedgerException(
                domain::ErrorCode::INVALID_TRANSFER,
                "Amount must be positive and in " + account.currency,
                account.accountId, amount, domain::TransactionStatus::LOCKED);
        }
    }

    static void requireVersion(const domain::Account& account, std::optional<uint64_t> expectedVersion) {
        if (expectedVersion && *expectedVersion != account.version) {
            throw domain::LedgerException(
                domain::ErrorCode::CONCURRENCY_CONFLICT,
                "Account " + account.accountId + " is at version " + std::to_string(account.version)
                    + ", expected " + std::to_string(*expectedVersion),
                account.accountId, std::nullopt, domain::TransactionStatus::LOCKED);
        }
    }

    static void requireFunds(const domain::Account& account, const domain::Money& amount) {
        if (!account.canDebit(amount)) {
            throw domain::LedgerException(
                domain::ErrorCode::INSUFFICIENT_FUNDS,
                "Insufficient funds on " + account.accountId + ": balance "
                    + account.balance.toString() + ", requested " + amount.toString(),
                account.accountId, amount, domain::TransactionStatus::LOCKED);
        }
    }

    /**
     * @brief commit() хранилища с повтором временных сбоев
     *
     * Исчерпанные повторы и прочие сбои записи: AUDIT_WRITE_FAILURE.
     * Конфликт версий не повторяется.
     */
    void commit(const std::vector<domain::Account>& updated, domain::Transaction& record) {
        record.advance(domain::TransactionStatus::COMMITTED);
        record.timestamp = domain::Timestamp::now();

        const std::string& accountId = updated.front().accountId;
        try {
            withStoreRetry("commit", accountId, domain::TransactionStatus::LOCKED,
                           domain::ErrorCode::AUDIT_WRITE_FAILURE,
                           [&]() { accounts_->commit(updated, record); });
        } catch (const domain::LedgerException&) {
            throw;
        } catch (const ports::output::VersionConflictError& e) {
            throw domain::LedgerException(
                domain::ErrorCode::CONCURRENCY_CONFLICT, e.what(), e.accountId(),
                std::nullopt, domain::TransactionStatus::LOCKED);
        } catch (const std::exception& e) {
            throw domain::LedgerException(
                domain::ErrorCode::AUDIT_WRITE_FAILURE,
                std::string("Audited commit failed: ") + e.what(),
                accountId, std::nullopt, domain::TransactionStatus::LOCKED);
        }
    }

    /**
     * @brief balance + delta (или - delta) с проверкой диапазона
     * @throws domain::LedgerException INVALID_TRANSFER если результат не помещается в Money
     */
    static domain::Money shifted(const domain::Account& account, const domain::Money& delta, bool credit) {
        try {
            return credit ? account.balance + delta : account.balance - delta;
        } catch (const std::overflow_error& e) {
            throw domain::LedgerException(
                domain::ErrorCode::INVALID_TRANSFER,
                "Balance of " + account.accountId + " would leave the representable range: " + e.what(),
                account.accountId, delta, domain::TransactionStatus::LOCKED);
        }
    }

    std::shared_ptr<ports::output::IAccountRepository> accounts_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    ThreadSafeMap<std::string, std::timed_mutex> lockRegistry_;
};

} // namespace ledger::application
