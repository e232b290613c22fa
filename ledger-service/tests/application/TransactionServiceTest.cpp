/**
 * @file TransactionServiceTest.cpp
 * @brief Unit tests for TransactionService
 */

#include <gtest/gtest.h>
#include "application/TransactionService.hpp"
#include "application/ExchangeRateService.hpp"
#include "../mocks/InMemoryLedgerStore.hpp"
#include "../mocks/MockEventPublisher.hpp"
#include "../mocks/FakeExchangeRateSource.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdlib>
#include <future>
#include <set>
#include <thread>

using namespace ledger;
using namespace ledger::application;
using namespace ledger::tests;

class TransactionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryLedgerStore>();
        settings_ = std::make_shared<settings::LedgerSettings>();
        settings_->setStoreRetryBackoffMs(1);
        ledger_ = std::make_shared<AccountLedger>(store_, settings_);

        primary_ = std::make_shared<FakeExchangeRateSource>("primary");
        fallback_ = std::make_shared<FakeExchangeRateSource>("fallback");
        primary_->setRate("USD", "EUR", "0.85");
        primary_->setRate("EUR", "USD", "1.176470588");
        fallback_->setRate("USD", "EUR", "0.86");
        rates_ = std::make_shared<ExchangeRateService>(primary_, fallback_);

        publisher_ = std::make_shared<MockEventPublisher>();
        service_ = std::make_shared<TransactionService>(ledger_, store_, rates_, publisher_);
    }

    static domain::Money usd(const std::string& amount) { return domain::Money::fromString(amount, "USD"); }
    static domain::Money eur(const std::string& amount) { return domain::Money::fromString(amount, "EUR"); }

    domain::TransferRequest transferRequest(const std::string& from, const std::string& to,
                                            const domain::Money& amount, const std::string& key) {
        domain::TransferRequest request;
        request.sourceAccountId = from;
        request.destinationAccountId = to;
        request.amount = amount;
        request.idempotencyKey = key;
        return request;
    }

    domain::BalanceRequest balanceRequest(const std::string& accountId, const domain::Money& amount,
                                          const std::string& key) {
        domain::BalanceRequest request;
        request.accountId = accountId;
        request.amount = amount;
        request.idempotencyKey = key;
        return request;
    }

    template <typename Fn>
    static std::optional<domain::LedgerException> captureError(Fn&& fn) {
        try {
            fn();
        } catch (const domain::LedgerException& e) {
            return e;
        }
        return std::nullopt;
    }

    std::shared_ptr<InMemoryLedgerStore> store_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<AccountLedger> ledger_;
    std::shared_ptr<FakeExchangeRateSource> primary_;
    std::shared_ptr<FakeExchangeRateSource> fallback_;
    std::shared_ptr<ExchangeRateService> rates_;
    std::shared_ptr<MockEventPublisher> publisher_;
    std::shared_ptr<TransactionService> service_;
};

// ============================================================================
// DEPOSIT / WITHDRAW
// ============================================================================

TEST_F(TransactionServiceTest, Deposit_IncreasesBalance) {
    store_->seed("acc-A", "USD", "100.00");

    auto result = service_->deposit(balanceRequest("acc-A", usd("10.00"), "dep-1"));

    EXPECT_EQ(result.newBalance, usd("110.00"));
    EXPECT_EQ(result.applied, usd("10.00"));
    EXPECT_FALSE(result.replayed);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("110.00"));
    EXPECT_EQ(store_->findById("acc-A")->version, 2u);
}

TEST_F(TransactionServiceTest, ConcurrentDeposits_EndAtExactSum) {
    store_->seed("acc-A", "USD", "100.00");

    const int THREADS = 10;
    const int DEPOSITS_PER_THREAD = 100;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < DEPOSITS_PER_THREAD; ++i) {
                try {
                    service_->deposit(balanceRequest(
                        "acc-A", usd("10.00"), "dep-" + std::to_string(t) + "-" + std::to_string(i)));
                } catch (const domain::LedgerException&) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("10100.00"));
    EXPECT_EQ(store_->findById("acc-A")->version, 1001u);
    EXPECT_EQ(store_->committedCount(), 1001u);
}

TEST_F(TransactionServiceTest, Deposit_ForeignCurrency_ConvertedToAccountCurrency) {
    store_->seed("acc-G", "GBP", "0.00");
    primary_->setRate("EUR", "GBP", "0.86");

    auto result = service_->deposit(balanceRequest("acc-G", eur("100.00"), "dep-eur"));

    EXPECT_EQ(result.applied, domain::Money::fromString("86.00", "GBP"));
    EXPECT_EQ(result.newBalance, domain::Money::fromString("86.00", "GBP"));
    EXPECT_EQ(result.appliedRate, domain::Rate::fromString("0.86"));
}

TEST_F(TransactionServiceTest, Withdraw_DecreasesBalance) {
    store_->seed("acc-A", "USD", "100.00");

    auto result = service_->withdraw(balanceRequest("acc-A", usd("30.50"), "wd-1"));

    EXPECT_EQ(result.newBalance, usd("69.50"));
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("69.50"));
}

TEST_F(TransactionServiceTest, Withdraw_Overdraft_InsufficientFundsAndUnchanged) {
    store_->seed("acc-A", "USD", "50.00");

    auto error = captureError([&] { service_->withdraw(balanceRequest("acc-A", usd("50.01"), "wd-1")); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_EQ(error->accountId(), "acc-A");
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("50.00"));
}

TEST_F(TransactionServiceTest, Withdraw_ExactBalance_LeavesZero) {
    store_->seed("acc-A", "USD", "50.00");

    auto result = service_->withdraw(balanceRequest("acc-A", usd("50.00"), "wd-1"));

    EXPECT_TRUE(result.newBalance.isZero());
}

TEST_F(TransactionServiceTest, Deposit_ExpectedVersionMismatch_ConcurrencyConflict) {
    store_->seed("acc-A", "USD", "100.00");
    auto request = balanceRequest("acc-A", usd("10.00"), "dep-1");
    request.expectedVersion = 7;

    auto error = captureError([&] { service_->deposit(request); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::CONCURRENCY_CONFLICT);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("100.00"));
}

TEST_F(TransactionServiceTest, Deposit_ExpectedVersionMatches_Commits) {
    store_->seed("acc-A", "USD", "100.00");
    auto request = balanceRequest("acc-A", usd("10.00"), "dep-1");
    request.expectedVersion = 1;

    auto result = service_->deposit(request);

    EXPECT_EQ(result.newBalance, usd("110.00"));
}

// ============================================================================
// TRANSFER
// ============================================================================

TEST_F(TransactionServiceTest, Transfer_SameCurrency_ConservesSum) {
    store_->seed("acc-A", "USD", "500.00");
    store_->seed("acc-B", "USD", "250.00");

    auto result = service_->transfer(transferRequest("acc-A", "acc-B", usd("120.35"), "tr-1"));

    EXPECT_EQ(result.sourceBalance, usd("379.65"));
    EXPECT_EQ(result.destinationBalance, usd("370.35"));
    EXPECT_TRUE(result.appliedRate.isOne());
    EXPECT_EQ(result.rateSource, domain::RateSource::IDENTITY);
    EXPECT_EQ(store_->balanceOf("acc-A") + store_->balanceOf("acc-B"), usd("750.00"));
    EXPECT_EQ(primary_->calls(), 0);
}

TEST_F(TransactionServiceTest, Transfer_CrossCurrency_CreditRoundedHalfEven) {
    store_->seed("acc-A", "USD", "1000.00");
    store_->seed("acc-B", "EUR", "0.00");

    auto result = service_->transfer(transferRequest("acc-A", "acc-B", usd("33.33"), "tr-1"));

    // 33.33 * 0.85 = 28.3305 -> 28.33
    EXPECT_EQ(result.debit, usd("33.33"));
    EXPECT_EQ(result.credit, eur("28.33"));
    EXPECT_EQ(result.sourceBalance, usd("966.67"));
    EXPECT_EQ(result.destinationBalance, eur("28.33"));
    EXPECT_EQ(result.appliedRate, domain::Rate::fromString("0.85"));
    EXPECT_EQ(result.rateSource, domain::RateSource::PRIMARY);
}

TEST_F(TransactionServiceTest, Transfer_CrossCurrencyRoundTrip_WithinOneMinorUnit) {
    store_->seed("acc-A", "USD", "1000.00");
    store_->seed("acc-B", "EUR", "0.00");

    auto there = service_->transfer(transferRequest("acc-A", "acc-B", usd("100.00"), "tr-there"));
    EXPECT_EQ(there.credit, eur("85.00"));

    auto back = service_->transfer(transferRequest("acc-B", "acc-A", there.credit, "tr-back"));

    auto original = usd("1000.00");
    auto finalBalance = store_->balanceOf("acc-A");
    EXPECT_LE(std::llabs(finalBalance.minorUnits - original.minorUnits), 1);
    EXPECT_TRUE(store_->balanceOf("acc-B").isZero());
    EXPECT_EQ(back.appliedRate, domain::Rate::fromString("1.176470588"));
}

TEST_F(TransactionServiceTest, Transfer_Overdraft_InsufficientFundsAndUnchanged) {
    store_->seed("acc-A", "USD", "50.00");
    store_->seed("acc-B", "USD", "0.00");

    auto error = captureError([&] {
        service_->transfer(transferRequest("acc-A", "acc-B", usd("50.01"), "tr-1"));
    });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_EQ(error->stage(), domain::TransactionStatus::LOCKED);
    ASSERT_TRUE(error->amount().has_value());
    EXPECT_EQ(*error->amount(), usd("50.01"));
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("50.00"));
    EXPECT_EQ(store_->balanceOf("acc-B"), usd("0.00"));
}

TEST_F(TransactionServiceTest, Transfer_FailedAttempt_IsJournaledAndPublished) {
    store_->seed("acc-A", "USD", "10.00");
    store_->seed("acc-B", "USD", "0.00");

    captureError([&] { service_->transfer(transferRequest("acc-A", "acc-B", usd("20.00"), "tr-1")); });

    ASSERT_EQ(store_->failedCount(), 1u);
    auto failed = store_->journal().back();
    EXPECT_EQ(failed.status, domain::TransactionStatus::FAILED);
    EXPECT_EQ(failed.error, domain::ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_EQ(failed.stage, domain::TransactionStatus::LOCKED);
    EXPECT_EQ(failed.idempotencyKey, "tr-1");

    ASSERT_EQ(publisher_->countByKey("transaction.failed"), 1u);
    auto json = nlohmann::json::parse(publisher_->lastMessage("transaction.failed"));
    EXPECT_EQ(json["transaction"]["error"], "INSUFFICIENT_FUNDS");
}

TEST_F(TransactionServiceTest, Transfer_Committed_PublishesEvent) {
    store_->seed("acc-A", "USD", "100.00");
    store_->seed("acc-B", "USD", "0.00");

    auto result = service_->transfer(transferRequest("acc-A", "acc-B", usd("25.00"), "tr-1"));

    ASSERT_EQ(publisher_->countByKey("transaction.committed"), 1u);
    auto json = nlohmann::json::parse(publisher_->lastMessage("transaction.committed"));
    EXPECT_EQ(json["eventType"], "transaction.committed");
    EXPECT_EQ(json["aggregateId"], result.transactionId);
    EXPECT_EQ(json["transaction"]["transaction_id"], result.transactionId);
    EXPECT_EQ(json["transaction"]["debit"]["amount"], "25.00");
    EXPECT_EQ(json["transaction"]["source_balance"]["amount"], "75.00");
}

TEST_F(TransactionServiceTest, Transfer_PublisherDown_StillCommits) {
    store_->seed("acc-A", "USD", "100.00");
    store_->seed("acc-B", "USD", "0.00");
    publisher_->brokerDown();

    auto result = service_->transfer(transferRequest("acc-A", "acc-B", usd("25.00"), "tr-1"));

    EXPECT_EQ(result.sourceBalance, usd("75.00"));
    EXPECT_EQ(store_->balanceOf("acc-B"), usd("25.00"));
}

TEST_F(TransactionServiceTest, Transfer_ToSelf_InvalidTransfer) {
    store_->seed("acc-A", "USD", "100.00");

    auto error = captureError([&] { service_->transfer(transferRequest("acc-A", "acc-A", usd("1.00"), "tr-1")); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::INVALID_TRANSFER);
    EXPECT_EQ(error->stage(), domain::TransactionStatus::PENDING);
}

TEST_F(TransactionServiceTest, Transfer_NonPositiveAmount_InvalidTransfer) {
    store_->seed("acc-A", "USD", "100.00");
    store_->seed("acc-B", "USD", "0.00");

    auto zero = captureError([&] { service_->transfer(transferRequest("acc-A", "acc-B", usd("0.00"), "tr-1")); });
    auto negative = captureError([&] { service_->transfer(transferRequest("acc-A", "acc-B", usd("-5.00"), "tr-2")); });

    ASSERT_TRUE(zero.has_value());
    ASSERT_TRUE(negative.has_value());
    EXPECT_EQ(zero->code(), domain::ErrorCode::INVALID_TRANSFER);
    EXPECT_EQ(negative->code(), domain::ErrorCode::INVALID_TRANSFER);
}

TEST_F(TransactionServiceTest, Transfer_AmountNotInSourceCurrency_InvalidTransfer) {
    store_->seed("acc-A", "USD", "100.00");
    store_->seed("acc-B", "EUR", "0.00");

    auto error = captureError([&] { service_->transfer(transferRequest("acc-A", "acc-B", eur("10.00"), "tr-1")); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::INVALID_TRANSFER);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("100.00"));
}

TEST_F(TransactionServiceTest, Transfer_CreditRoundsToZero_InvalidTransfer) {
    store_->seed("acc-A", "USD", "100.00");
    store_->seed("acc-J", "JPY", "0");
    primary_->setRate("USD", "JPY", "0.4");

    // 0.01 * 0.4 = 0.004 JPY -> 0
    auto error = captureError([&] { service_->transfer(transferRequest("acc-A", "acc-J", usd("0.01"), "tr-1")); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::INVALID_TRANSFER);
}

TEST_F(TransactionServiceTest, Transfer_EmptyIdempotencyKey_InvalidTransfer) {
    store_->seed("acc-A", "USD", "100.00");
    store_->seed("acc-B", "USD", "0.00");

    auto error = captureError([&] { service_->transfer(transferRequest("acc-A", "acc-B", usd("1.00"), "")); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::INVALID_TRANSFER);
}

TEST_F(TransactionServiceTest, Transfer_UnknownAccount_AccountNotFound) {
    store_->seed("acc-A", "USD", "100.00");

    auto error = captureError([&] { service_->transfer(transferRequest("acc-A", "acc-X", usd("1.00"), "tr-1")); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::ACCOUNT_NOT_FOUND);
    EXPECT_EQ(error->accountId(), "acc-X");
}

TEST_F(TransactionServiceTest, Transfer_ClosedDestination_AccountClosed) {
    store_->seed("acc-A", "USD", "100.00");

    domain::Account closed;
    closed.accountId = "acc-C";
    closed.ownerId = "owner-1";
    closed.currency = "USD";
    closed.balance = usd("5.00");
    closed.version = 2;
    closed.closed = true;
    domain::Transaction opening;
    opening.transactionId = "tx-open-c";
    opening.type = domain::TransactionType::OPENING;
    store_->create(closed, opening);

    auto error = captureError([&] { service_->transfer(transferRequest("acc-A", "acc-C", usd("1.00"), "tr-1")); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::ACCOUNT_CLOSED);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("100.00"));
}

// ============================================================================
// IDEMPOTENCY
// ============================================================================

TEST_F(TransactionServiceTest, Transfer_ReplayedKey_ReturnsSameResultWithoutSecondMutation) {
    store_->seed("acc-A", "USD", "100.00");
    store_->seed("acc-B", "USD", "0.00");
    auto request = transferRequest("acc-A", "acc-B", usd("40.00"), "tr-1");

    auto first = service_->transfer(request);
    auto second = service_->transfer(request);

    EXPECT_FALSE(first.replayed);
    EXPECT_TRUE(second.replayed);
    EXPECT_EQ(second.transactionId, first.transactionId);
    EXPECT_EQ(second.sourceBalance, first.sourceBalance);
    EXPECT_EQ(second.destinationBalance, first.destinationBalance);
    EXPECT_EQ(second.appliedRate, first.appliedRate);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("60.00"));
    EXPECT_EQ(store_->balanceOf("acc-B"), usd("40.00"));
    EXPECT_EQ(publisher_->countByKey("transaction.committed"), 1u);
}

TEST_F(TransactionServiceTest, Deposit_ReplayedKey_DoesNotDepositTwice) {
    store_->seed("acc-A", "USD", "100.00");

    service_->deposit(balanceRequest("acc-A", usd("10.00"), "dep-1"));
    auto replay = service_->deposit(balanceRequest("acc-A", usd("10.00"), "dep-1"));

    EXPECT_TRUE(replay.replayed);
    EXPECT_EQ(replay.newBalance, usd("110.00"));
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("110.00"));
}

TEST_F(TransactionServiceTest, ReusedKeyWithDifferentParameters_InvalidTransfer) {
    store_->seed("acc-A", "USD", "100.00");
    store_->seed("acc-B", "USD", "0.00");
    service_->transfer(transferRequest("acc-A", "acc-B", usd("40.00"), "tr-1"));

    auto error = captureError([&] { service_->transfer(transferRequest("acc-A", "acc-B", usd("41.00"), "tr-1")); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::INVALID_TRANSFER);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("60.00"));
}

TEST_F(TransactionServiceTest, FailedAttempt_DoesNotConsumeKey) {
    store_->seed("acc-A", "USD", "10.00");
    store_->seed("acc-B", "USD", "0.00");
    auto request = transferRequest("acc-A", "acc-B", usd("40.00"), "tr-1");

    auto error = captureError([&] { service_->transfer(request); });
    ASSERT_TRUE(error.has_value());

    service_->deposit(balanceRequest("acc-A", usd("50.00"), "dep-1"));
    auto result = service_->transfer(request);

    EXPECT_FALSE(result.replayed);
    EXPECT_EQ(result.sourceBalance, usd("20.00"));
}

TEST_F(TransactionServiceTest, ConcurrentRequestsWithSameKey_ExecuteOnce) {
    store_->seed("acc-A", "USD", "100.00");
    store_->seed("acc-B", "USD", "0.00");
    auto request = transferRequest("acc-A", "acc-B", usd("30.00"), "tr-shared");

    const int THREADS = 8;
    std::vector<std::future<domain::TransferResult>> results;
    for (int i = 0; i < THREADS; ++i) {
        results.push_back(std::async(std::launch::async, [&]() { return service_->transfer(request); }));
    }

    std::set<std::string> ids;
    int fresh = 0;
    for (auto& f : results) {
        auto r = f.get();
        ids.insert(r.transactionId);
        if (!r.replayed) ++fresh;
    }

    EXPECT_EQ(ids.size(), 1u);
    EXPECT_EQ(fresh, 1);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("70.00"));
    EXPECT_EQ(store_->balanceOf("acc-B"), usd("30.00"));
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST_F(TransactionServiceTest, OppositeConcurrentTransfers_AllComplete) {
    store_->seed("acc-A", "USD", "1000.00");
    store_->seed("acc-B", "USD", "1000.00");

    const int TRANSFERS = 200;
    std::atomic<int> failures{0};

    std::thread forward([&]() {
        for (int i = 0; i < TRANSFERS; ++i) {
            try {
                service_->transfer(transferRequest("acc-A", "acc-B", usd("1.00"), "ab-" + std::to_string(i)));
            } catch (const domain::LedgerException&) {
                ++failures;
            }
        }
    });
    std::thread backward([&]() {
        for (int i = 0; i < TRANSFERS; ++i) {
            try {
                service_->transfer(transferRequest("acc-B", "acc-A", usd("1.00"), "ba-" + std::to_string(i)));
            } catch (const domain::LedgerException&) {
                ++failures;
            }
        }
    });
    forward.join();
    backward.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("1000.00"));
    EXPECT_EQ(store_->balanceOf("acc-B"), usd("1000.00"));
    EXPECT_EQ(store_->committedCount(), 2u + 2u * TRANSFERS);
}

TEST_F(TransactionServiceTest, DeadlinePassesWhileWaitingForLock_RequestExpired) {
    store_->seed("acc-A", "USD", "100.00");

    std::promise<void> locked;
    std::promise<void> release;
    std::thread holder([&]() {
        auto locks = ledger_->acquire({"acc-A"});
        locked.set_value();
        release.get_future().wait();
    });
    locked.get_future().wait();

    auto request = balanceRequest("acc-A", usd("10.00"), "dep-1");
    request.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(30);
    auto error = captureError([&] { service_->deposit(request); });

    release.set_value();
    holder.join();

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::REQUEST_EXPIRED);
    EXPECT_EQ(error->stage(), domain::TransactionStatus::RATE_RESOLVED);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("100.00"));
}

TEST_F(TransactionServiceTest, DeadlinePassesWhileKeyHeldBySameKeyRequest_RequestExpired) {
    store_->seed("acc-A", "USD", "100.00");

    std::promise<void> locked;
    std::promise<void> release;
    std::thread holder([&]() {
        auto locks = ledger_->acquire({"acc-A"});
        locked.set_value();
        release.get_future().wait();
    });
    locked.get_future().wait();

    // Первый запрос берёт ключ и ждёт блокировку счёта
    auto first = std::async(std::launch::async, [&]() {
        return service_->deposit(balanceRequest("acc-A", usd("10.00"), "dep-1"));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto second = balanceRequest("acc-A", usd("10.00"), "dep-1");
    second.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(30);
    auto error = captureError([&] { service_->deposit(second); });

    release.set_value();
    holder.join();
    auto committed = first.get();

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::REQUEST_EXPIRED);
    EXPECT_EQ(error->stage(), domain::TransactionStatus::PENDING);
    EXPECT_EQ(committed.newBalance, usd("110.00"));
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("110.00"));
}

// ============================================================================
// RATES
// ============================================================================

TEST_F(TransactionServiceTest, BothRateSourcesDown_RateUnavailableAndUnchanged) {
    store_->seed("acc-A", "USD", "100.00");
    store_->seed("acc-B", "EUR", "0.00");
    primary_->setAvailable(false);
    fallback_->setAvailable(false);

    auto error = captureError([&] { service_->transfer(transferRequest("acc-A", "acc-B", usd("10.00"), "tr-1")); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::RATE_UNAVAILABLE);
    EXPECT_EQ(error->stage(), domain::TransactionStatus::PENDING);
    EXPECT_EQ(primary_->calls(), 1);
    EXPECT_EQ(fallback_->calls(), 1);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("100.00"));
    EXPECT_EQ(store_->balanceOf("acc-B"), eur("0.00"));
}

TEST_F(TransactionServiceTest, PrimaryDown_FallbackRateApplied) {
    store_->seed("acc-A", "USD", "100.00");
    store_->seed("acc-B", "EUR", "0.00");
    primary_->setAvailable(false);

    auto result = service_->transfer(transferRequest("acc-A", "acc-B", usd("10.00"), "tr-1"));

    EXPECT_EQ(result.credit, eur("8.60"));
    EXPECT_EQ(result.rateSource, domain::RateSource::FALLBACK);
    EXPECT_EQ(rates_->currentSourceName(), "fallback");
}

// ============================================================================
// STORE FAILURES
// ============================================================================

TEST_F(TransactionServiceTest, TransientStoreFailure_RetriedAndCommitted) {
    store_->seed("acc-A", "USD", "100.00");
    store_->failNextCommits(2);

    auto result = service_->deposit(balanceRequest("acc-A", usd("10.00"), "dep-1"));

    EXPECT_EQ(result.newBalance, usd("110.00"));
    EXPECT_EQ(store_->commitCalls(), 3);
}

TEST_F(TransactionServiceTest, TransientStoreFailureExhausted_AuditWriteFailure) {
    store_->seed("acc-A", "USD", "100.00");
    store_->seed("acc-B", "USD", "0.00");
    store_->failNextCommits(10);

    auto error = captureError([&] { service_->transfer(transferRequest("acc-A", "acc-B", usd("10.00"), "tr-1")); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::AUDIT_WRITE_FAILURE);
    EXPECT_EQ(store_->commitCalls(), settings_->getStoreRetryAttempts());
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("100.00"));
    EXPECT_EQ(store_->balanceOf("acc-B"), usd("0.00"));
}

TEST_F(TransactionServiceTest, PermanentStoreFailure_AuditWriteFailureWithoutRetry) {
    store_->seed("acc-A", "USD", "100.00");
    store_->failCommitsPermanently();

    auto error = captureError([&] { service_->withdraw(balanceRequest("acc-A", usd("10.00"), "wd-1")); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::AUDIT_WRITE_FAILURE);
    EXPECT_EQ(store_->commitCalls(), 1);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("100.00"));
}

TEST_F(TransactionServiceTest, JournalDownForFailedRecord_OriginalErrorSurfaces) {
    store_->seed("acc-A", "USD", "10.00");
    store_->failAppends();

    auto error = captureError([&] { service_->withdraw(balanceRequest("acc-A", usd("20.00"), "wd-1")); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::INSUFFICIENT_FUNDS);
}

TEST_F(TransactionServiceTest, DepositPushesBalanceOutOfRange_InvalidTransferAndJournaled) {
    store_->seed("acc-A", "USD", "90000000000000000.00");

    auto error = captureError([&] {
        service_->deposit(balanceRequest("acc-A", usd("90000000000000000.00"), "dep-1"));
    });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::INVALID_TRANSFER);
    EXPECT_EQ(error->stage(), domain::TransactionStatus::LOCKED);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("90000000000000000.00"));
    EXPECT_EQ(store_->failedCount(), 1u);
}

TEST_F(TransactionServiceTest, TransientAccountRead_RetriedAndCommitted) {
    store_->seed("acc-A", "USD", "100.00");
    store_->failNextReads(1);

    auto result = service_->deposit(balanceRequest("acc-A", usd("10.00"), "dep-1"));

    EXPECT_EQ(result.newBalance, usd("110.00"));
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("110.00"));
}

TEST_F(TransactionServiceTest, AccountReadsExhausted_StoreUnavailableJournaledAndPublished) {
    store_->seed("acc-A", "USD", "100.00");
    store_->seed("acc-B", "USD", "0.00");
    store_->failNextReads(settings_->getStoreRetryAttempts());

    auto error = captureError([&] { service_->transfer(transferRequest("acc-A", "acc-B", usd("10.00"), "tr-1")); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::STORE_UNAVAILABLE);
    EXPECT_EQ(error->accountId(), "acc-A");
    EXPECT_EQ(error->stage(), domain::TransactionStatus::PENDING);

    ASSERT_EQ(store_->failedCount(), 1u);
    auto failed = store_->journal().back();
    EXPECT_EQ(failed.error, domain::ErrorCode::STORE_UNAVAILABLE);
    EXPECT_EQ(failed.idempotencyKey, "tr-1");
    EXPECT_EQ(publisher_->countByKey("transaction.failed"), 1u);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("100.00"));
}

TEST_F(TransactionServiceTest, TransientIdempotencyLookup_Retried) {
    store_->seed("acc-A", "USD", "100.00");
    service_->deposit(balanceRequest("acc-A", usd("10.00"), "dep-1"));
    store_->failNextLookups(1);

    auto replay = service_->deposit(balanceRequest("acc-A", usd("10.00"), "dep-1"));

    EXPECT_TRUE(replay.replayed);
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("110.00"));
}

TEST_F(TransactionServiceTest, IdempotencyLookupExhausted_StoreUnavailable) {
    store_->seed("acc-A", "USD", "100.00");
    store_->failNextLookups(settings_->getStoreRetryAttempts());

    auto error = captureError([&] { service_->withdraw(balanceRequest("acc-A", usd("10.00"), "wd-1")); });

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code(), domain::ErrorCode::STORE_UNAVAILABLE);
    EXPECT_EQ(error->accountId(), "acc-A");
    EXPECT_EQ(store_->balanceOf("acc-A"), usd("100.00"));
    EXPECT_EQ(store_->failedCount(), 1u);
}
