#pragma once

#include "ports/input/IReconciliationService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IAuditLog.hpp"
#include <iostream>
#include <map>
#include <memory>

namespace ledger::application {

/**
 * @brief Сверка: баланс каждого счёта равен проигранному журналу
 *
 * Проигрываются только COMMITTED записи в порядке добавления.
 * Для переводов дополнительно проверяется, что credit равен
 * debit * rate с округлением half-even до шкалы валюты получателя.
 */
class LedgerReconciler : public ports::input::IReconciliationService {
public:
    LedgerReconciler(
        std::shared_ptr<ports::output::IAccountRepository> accounts,
        std::shared_ptr<ports::output::IAuditLog> auditLog
    ) : accounts_(std::move(accounts))
      , auditLog_(std::move(auditLog)) {}

    ports::input::ReconciliationReport reconcile() override {
        ports::input::ReconciliationReport report;

        auto accounts = accounts_->findAll();
        std::map<std::string, domain::Money> replayed;
        for (const auto& account : accounts) {
            replayed.emplace(account.accountId, domain::Money::zero(account.currency));
        }

        for (const auto& tx : auditLog_->findAllRecords()) {
            if (!tx.isCommitted()) {
                continue;
            }
            ++report.recordsReplayed;

            switch (tx.type) {
                case domain::TransactionType::OPENING:
                case domain::TransactionType::DEPOSIT:
                    apply(replayed, tx.destinationAccountId, tx.credit.value_or(tx.requested), true);
                    break;
                case domain::TransactionType::WITHDRAWAL:
                    apply(replayed, tx.sourceAccountId, tx.debit.value_or(tx.requested), false);
                    break;
                case domain::TransactionType::TRANSFER:
                    apply(replayed, tx.sourceAccountId, tx.debit.value_or(tx.requested), false);
                    apply(replayed, tx.destinationAccountId, tx.credit.value_or(tx.requested), true);
                    checkConversion(report, tx);
                    break;
                case domain::TransactionType::CLOSURE:
                    break;
            }
        }

        for (const auto& account : accounts) {
            ++report.accountsChecked;
            const auto& expected = replayed.at(account.accountId);
            if (expected != account.balance) {
                report.balanceDiscrepancies.push_back({account.accountId, expected, account.balance});
            }
        }

        std::cout << "[LedgerReconciler] Checked " << report.accountsChecked << " accounts, replayed "
                  << report.recordsReplayed << " records: "
                  << report.balanceDiscrepancies.size() << " balance and "
                  << report.conversionDiscrepancies.size() << " conversion discrepancies" << std::endl;
        return report;
    }

private:
    static void apply(std::map<std::string, domain::Money>& balances,
                      const std::string& accountId,
                      const domain::Money& amount,
                      bool credit) {
        auto it = balances.find(accountId);
        if (it == balances.end()) {
            std::cerr << "[LedgerReconciler] Journal references unknown account " << accountId << std::endl;
            return;
        }
        it->second = credit ? it->second + amount : it->second - amount;
    }

    static void checkConversion(ports::input::ReconciliationReport& report, const domain::Transaction& tx) {
        if (!tx.debit || !tx.credit) {
            return;
        }
        auto expected = tx.debit->convertTo(tx.rate, tx.credit->currency);
        if (expected != *tx.credit) {
            report.conversionDiscrepancies.push_back({tx.transactionId, expected, *tx.credit});
        }
    }

    std::shared_ptr<ports::output::IAccountRepository> accounts_;
    std::shared_ptr<ports::output::IAuditLog> auditLog_;
};

} // namespace ledger::application
