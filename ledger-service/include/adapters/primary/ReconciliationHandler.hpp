#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpMapping.hpp"
#include "ports/input/IReconciliationService.hpp"
#include <memory>
#include <iostream>

namespace ledger::adapters::primary
{

    /**
     * @brief GET /api/v1/reconciliation: сверка балансов с журналом
     *
     * 200 если расхождений нет, 409 если есть (тело содержит отчёт).
     */
    class ReconciliationHandler : public IHttpHandler
    {
    public:
        explicit ReconciliationHandler(std::shared_ptr<ports::input::IReconciliationService> reconciler)
            : reconciler_(std::move(reconciler))
        {
            std::cout << "[ReconciliationHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto report = reconciler_->reconcile();

                nlohmann::json balances = nlohmann::json::array();
                for (const auto &d : report.balanceDiscrepancies)
                {
                    balances.push_back({{"account_id", d.accountId},
                                        {"expected", moneyToJson(d.expected)},
                                        {"actual", moneyToJson(d.actual)}});
                }

                nlohmann::json conversions = nlohmann::json::array();
                for (const auto &d : report.conversionDiscrepancies)
                {
                    conversions.push_back({{"transaction_id", d.transactionId},
                                           {"expected_credit", moneyToJson(d.expectedCredit)},
                                           {"recorded_credit", moneyToJson(d.recordedCredit)}});
                }

                nlohmann::json response;
                response["consistent"] = report.isConsistent();
                response["accounts_checked"] = report.accountsChecked;
                response["records_replayed"] = report.recordsReplayed;
                response["balance_discrepancies"] = balances;
                response["conversion_discrepancies"] = conversions;

                res.setResult(report.isConsistent() ? 200 : 409, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[ReconciliationHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IReconciliationService> reconciler_;
    };

} // namespace ledger::adapters::primary
