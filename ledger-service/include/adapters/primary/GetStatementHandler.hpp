#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpMapping.hpp"
#include "ports/input/IAccountService.hpp"
#include "domain/events/TransactionEvent.hpp"
#include <memory>
#include <iostream>

namespace ledger::adapters::primary
{

    /**
     * @brief GET /api/v1/transactions?account_id=...: выписка, новые первыми
     */
    class GetStatementHandler : public IHttpHandler
    {
    public:
        explicit GetStatementHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[GetStatementHandler] Created" << std::endl;
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
                auto accountId = req.getQueryParam("account_id").value_or("");
                if (accountId.empty())
                {
                    sendError(res, 400, "account_id query parameter is required");
                    return;
                }

                nlohmann::json transactions = nlohmann::json::array();
                for (const auto &tx : accountService_->getStatement(accountId))
                {
                    transactions.push_back(domain::transactionToJson(tx));
                }

                nlohmann::json response;
                response["account_id"] = accountId;
                response["transactions"] = transactions;
                res.setResult(200, "application/json", response.dump());
            }
            catch (const domain::LedgerException &e)
            {
                sendLedgerError(res, e);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetStatementHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace ledger::adapters::primary
