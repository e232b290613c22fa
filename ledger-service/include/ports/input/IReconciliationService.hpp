#pragma once

#include "domain/Money.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace ledger::ports::input {

struct BalanceDiscrepancy {
    std::string accountId;
    domain::Money expected;   ///< Баланс, восстановленный по журналу
    domain::Money actual;     ///< Баланс в хранилище
};

struct ConversionDiscrepancy {
    std::string transactionId;
    domain::Money expectedCredit;
    domain::Money recordedCredit;
};

struct ReconciliationReport {
    size_t accountsChecked = 0;
    size_t recordsReplayed = 0;
    std::vector<BalanceDiscrepancy> balanceDiscrepancies;
    std::vector<ConversionDiscrepancy> conversionDiscrepancies;

    bool isConsistent() const {
        return balanceDiscrepancies.empty() && conversionDiscrepancies.empty();
    }
};

/**
 * @brief Сверка балансов с журналом
 */
class IReconciliationService {
public:
    virtual ~IReconciliationService() = default;

    virtual ReconciliationReport reconcile() = 0;
};

} // namespace ledger::ports::input
