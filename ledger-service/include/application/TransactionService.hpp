#pragma once

#include "ports/input/ITransactionService.hpp"
#include "ports/output/IAuditLog.hpp"
#include "ports/output/IExchangeRateProvider.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/AccountLedger.hpp"
#include "domain/Currency.hpp"
#include "domain/events/TransactionEvent.hpp"
#include <KeyedMutex.hpp>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>

namespace ledger::application {

/**
 * @brief Движок транзакций: пополнение, списание, перевод
 *
 * Конвейер одной операции:
 * PENDING -> RATE_RESOLVED -> LOCKED -> COMMITTED, либо FAILED до коммита.
 *
 * - курс запрашивается до захвата блокировок (ни одна блокировка счёта
 *   не держится во время сетевого вызова)
 * - блокировки берутся через AccountLedger в порядке возрастания id
 * - балансы и запись журнала сохраняются одним commit() хранилища
 * - запросы с одинаковым idempotency key выполняются строго по одному
 *
 * Итог публикуется событием transaction.committed / transaction.failed.
 */
class TransactionService : public ports::input::ITransactionService {
public:
    TransactionService(
        std::shared_ptr<AccountLedger> ledger,
        std::shared_ptr<ports::output::IAuditLog> auditLog,
        std::shared_ptr<ports::output::IExchangeRateProvider> rates,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher
    ) : ledger_(std::move(ledger))
      , auditLog_(std::move(auditLog))
      , rates_(std::move(rates))
      , eventPublisher_(std::move(eventPublisher))
      , rng_(std::random_device{}())
    {
        std::cout << "[TransactionService] Created" << std::endl;
    }

    domain::BalanceResult deposit(const domain::BalanceRequest& request) override {
        auto tx = newRecord(domain::TransactionType::DEPOSIT, request.idempotencyKey, request.description);
        tx.destinationAccountId = request.accountId;
        tx.requested = request.amount;

        try {
            requireKey(request.idempotencyKey, request.accountId, request.amount);
            requirePositive(request.amount, request.accountId);

            KeyedMutex::Guard guard(idempotencyKeys_, request.idempotencyKey, request.deadline);
            requireKeyOwned(guard, request.idempotencyKey, request.accountId, request.amount);
            if (auto prior = findReplay(tx)) {
                std::cout << "[TransactionService] Replayed deposit " << prior->transactionId
                          << " for key " << request.idempotencyKey << std::endl;
                return domain::BalanceResult::fromTransaction(*prior, true);
            }

            auto account = ledger_->load(request.accountId);
            requireOpen(account);
            auto credit = resolve(tx, request.amount, account.currency, account.accountId);
            tx.credit = credit;

            auto locks = ledger_->acquire({account.accountId}, request.deadline);
            tx.advance(domain::TransactionStatus::LOCKED);

            ledger_->deposit(locks, account.accountId, credit, tx, request.expectedVersion);
        } catch (const domain::LedgerException& e) {
            throw fail(tx, e);
        }

        committed(tx);
        return domain::BalanceResult::fromTransaction(tx);
    }

    domain::BalanceResult withdraw(const domain::BalanceRequest& request) override {
        auto tx = newRecord(domain::TransactionType::WITHDRAWAL, request.idempotencyKey, request.description);
        tx.sourceAccountId = request.accountId;
        tx.requested = request.amount;

        try {
            requireKey(request.idempotencyKey, request.accountId, request.amount);
            requirePositive(request.amount, request.accountId);

            KeyedMutex::Guard guard(idempotencyKeys_, request.idempotencyKey, request.deadline);
            requireKeyOwned(guard, request.idempotencyKey, request.accountId, request.amount);
            if (auto prior = findReplay(tx)) {
                std::cout << "[TransactionService] Replayed withdrawal " << prior->transactionId
                          << " for key " << request.idempotencyKey << std::endl;
                return domain::BalanceResult::fromTransaction(*prior, true);
            }

            auto account = ledger_->load(request.accountId);
            requireOpen(account);
            auto debit = resolve(tx, request.amount, account.currency, account.accountId);
            tx.debit = debit;

            auto locks = ledger_->acquire({account.accountId}, request.deadline);
            tx.advance(domain::TransactionStatus::LOCKED);

            ledger_->withdraw(locks, account.accountId, debit, tx, request.expectedVersion);
        } catch (const domain::LedgerException& e) {
            throw fail(tx, e);
        }

        committed(tx);
        return domain::BalanceResult::fromTransaction(tx);
    }

    domain::TransferResult transfer(const domain::TransferRequest& request) override {
        auto tx = newRecord(domain::TransactionType::TRANSFER, request.idempotencyKey, request.description);
        tx.sourceAccountId = request.sourceAccountId;
        tx.destinationAccountId = request.destinationAccountId;
        tx.requested = request.amount;

        try {
            requireKey(request.idempotencyKey, request.sourceAccountId, request.amount);
            requirePositive(request.amount, request.sourceAccountId);
            if (request.sourceAccountId == request.destinationAccountId) {
                throw domain::LedgerException(
                    domain::ErrorCode::INVALID_TRANSFER,
                    "Cannot transfer to the same account",
                    request.sourceAccountId, request.amount);
            }

            KeyedMutex::Guard guard(idempotencyKeys_, request.idempotencyKey, request.deadline);
            requireKeyOwned(guard, request.idempotencyKey, request.sourceAccountId, request.amount);
            if (auto prior = findReplay(tx)) {
                std::cout << "[TransactionService] Replayed transfer " << prior->transactionId
                          << " for key " << request.idempotencyKey << std::endl;
                return domain::TransferResult::fromTransaction(*prior, true);
            }

            auto source = ledger_->load(request.sourceAccountId);
            auto destination = ledger_->load(request.destinationAccountId);
            requireOpen(source);
            requireOpen(destination);
            if (request.amount.currency != source.currency) {
                throw domain::LedgerException(
                    domain::ErrorCode::INVALID_TRANSFER,
                    "Transfer amount must be in the source account currency " + source.currency,
                    source.accountId, request.amount);
            }

            auto credit = resolve(tx, request.amount, destination.currency, destination.accountId);
            tx.debit = request.amount;
            tx.credit = credit;

            auto locks = ledger_->acquire({source.accountId, destination.accountId}, request.deadline);
            tx.advance(domain::TransactionStatus::LOCKED);

            ledger_->transferLocked(locks, source.accountId, destination.accountId, request.amount, credit, tx);
        } catch (const domain::LedgerException& e) {
            throw fail(tx, e);
        }

        committed(tx);
        return domain::TransferResult::fromTransaction(tx);
    }

private:
    std::shared_ptr<AccountLedger> ledger_;
    std::shared_ptr<ports::output::IAuditLog> auditLog_;
    std::shared_ptr<ports::output::IExchangeRateProvider> rates_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;

    KeyedMutex idempotencyKeys_;

    std::mutex rngMutex_;
    std::mt19937_64 rng_;

    domain::Transaction newRecord(
        domain::TransactionType type,
        const std::string& idempotencyKey,
        const std::string& description)
    {
        domain::Transaction tx;
        tx.transactionId = generateTransactionId();
        tx.type = type;
        tx.idempotencyKey = idempotencyKey;
        tx.description = description;
        tx.timestamp = domain::Timestamp::now();
        return tx;
    }

    static void requireKey(const std::string& key, const std::string& accountId, const domain::Money& amount) {
        if (key.empty()) {
            throw domain::LedgerException(
                domain::ErrorCode::INVALID_TRANSFER, "Idempotency key is required", accountId, amount);
        }
    }

    /// Дедлайн истёк, пока ключ держал другой запрос с тем же idempotency key
    static void requireKeyOwned(
        const KeyedMutex::Guard& guard,
        const std::string& key,
        const std::string& accountId,
        const domain::Money& amount)
    {
        if (!guard.owns()) {
            throw domain::LedgerException(
                domain::ErrorCode::REQUEST_EXPIRED,
                "Deadline passed while waiting for idempotency key " + key, accountId, amount);
        }
    }

    static void requirePositive(const domain::Money& amount, const std::string& accountId) {
        if (!amount.isPositive()) {
            throw domain::LedgerException(
                domain::ErrorCode::INVALID_TRANSFER,
                "Amount must be positive, got " + amount.toString(), accountId, amount);
        }
        if (!domain::isSupportedCurrency(amount.currency)) {
            throw domain::LedgerException(
                domain::ErrorCode::INVALID_TRANSFER,
                "Unsupported currency: " + amount.currency, accountId, amount);
        }
    }

    static void requireOpen(const domain::Account& account) {
        if (account.closed) {
            throw domain::LedgerException(
                domain::ErrorCode::ACCOUNT_CLOSED, "Account is closed: " + account.accountId, account.accountId);
        }
    }

    /**
     * @brief Закоммиченная запись с тем же ключом, если она есть
     * @throws domain::LedgerException INVALID_TRANSFER если ключ уже использован с другими параметрами,
     *         STORE_UNAVAILABLE если журнал не ответил за все попытки
     */
    std::optional<domain::Transaction> findReplay(const domain::Transaction& candidate) {
        const std::string& accountId =
            candidate.sourceAccountId.empty() ? candidate.destinationAccountId : candidate.sourceAccountId;
        auto prior = ledger_->withStoreRetry(
            "findCommittedByIdempotencyKey", accountId, domain::TransactionStatus::PENDING,
            domain::ErrorCode::STORE_UNAVAILABLE,
            [&]() { return auditLog_->findCommittedByIdempotencyKey(candidate.idempotencyKey); });
        if (!prior) {
            return std::nullopt;
        }
        if (prior->type != candidate.type
            || prior->sourceAccountId != candidate.sourceAccountId
            || prior->destinationAccountId != candidate.destinationAccountId
            || prior->requested != candidate.requested) {
            throw domain::LedgerException(
                domain::ErrorCode::INVALID_TRANSFER,
                "Idempotency key " + candidate.idempotencyKey + " was already used for transaction "
                    + prior->transactionId + " with different parameters",
                accountId, candidate.requested);
        }
        return prior;
    }

    /**
     * @brief Шаг RATE_RESOLVED: перевести amount в targetCurrency
     *
     * Та же валюта: курс 1, без обращения к провайдеру.
     * Иначе результат округляется half-even до шкалы targetCurrency
     * и должен остаться положительным.
     */
    domain::Money resolve(
        domain::Transaction& tx,
        const domain::Money& amount,
        const std::string& targetCurrency,
        const std::string& accountId)
    {
        if (amount.currency == targetCurrency) {
            tx.rate = domain::Rate::one();
            tx.rateSource = domain::RateSource::IDENTITY;
            tx.advance(domain::TransactionStatus::RATE_RESOLVED);
            return amount;
        }

        auto rate = rates_->getRate(amount.currency, targetCurrency);

        domain::Money converted;
        try {
            converted = amount.convertTo(rate.rate, targetCurrency);
        } catch (const std::overflow_error& e) {
            throw domain::LedgerException(
                domain::ErrorCode::INVALID_TRANSFER,
                std::string("Converted amount out of range: ") + e.what(), accountId, amount);
        }
        if (!converted.isPositive()) {
            throw domain::LedgerException(
                domain::ErrorCode::INVALID_TRANSFER,
                "Amount " + amount.toString() + " " + amount.currency + " rounds to zero in " + targetCurrency,
                accountId, amount);
        }

        tx.rate = rate.rate;
        tx.rateSource = rate.source;
        tx.advance(domain::TransactionStatus::RATE_RESOLVED);
        return converted;
    }

    void committed(const domain::Transaction& tx) {
        std::cout << "[TransactionService] COMMITTED " << domain::toString(tx.type) << " "
                  << tx.transactionId << " key=" << tx.idempotencyKey << std::endl;
        publish(tx);
    }

    /**
     * @brief Записать FAILED-запись и вернуть исключение для проброса
     *
     * Сбой записи в журнал логируется и не подменяет исходную ошибку.
     */
    domain::LedgerException fail(domain::Transaction& tx, const domain::LedgerException& error) {
        auto stage = error.stage() > tx.stage ? error.stage() : tx.stage;

        tx.status = domain::TransactionStatus::FAILED;
        tx.stage = stage;
        tx.error = error.code();
        tx.message = error.what();
        tx.timestamp = domain::Timestamp::now();

        std::cerr << "[TransactionService] FAILED " << domain::toString(tx.type) << " "
                  << tx.transactionId << " at " << domain::toString(stage) << ": "
                  << domain::toString(error.code()) << " " << error.what() << std::endl;

        try {
            auditLog_->append(tx);
        } catch (const std::exception& e) {
            std::cerr << "[TransactionService] Could not journal failed transaction "
                      << tx.transactionId << ": " << e.what() << std::endl;
        }

        publish(tx);
        return error.atStage(stage);
    }

    void publish(const domain::Transaction& tx) {
        try {
            domain::TransactionEvent event(tx);
            eventPublisher_->publish(event.routingKey, event.toJson());
        } catch (const std::exception& e) {
            std::cerr << "[TransactionService] Failed to publish event for "
                      << tx.transactionId << ": " << e.what() << std::endl;
        }
    }

    std::string generateTransactionId() {
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(rngMutex_);
            id = rng_();
        }

        std::stringstream ss;
        ss << "tx-" << std::hex << std::setfill('0') << std::setw(16) << id;
        return ss.str();
    }
};

} // namespace ledger::application
