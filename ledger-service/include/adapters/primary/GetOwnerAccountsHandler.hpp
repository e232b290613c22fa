#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpMapping.hpp"
#include "ports/input/IAccountService.hpp"
#include <memory>
#include <iostream>

namespace ledger::adapters::primary
{

    /**
     * @brief GET /api/v1/accounts?owner_id=...: счета владельца
     */
    class GetOwnerAccountsHandler : public IHttpHandler
    {
    public:
        explicit GetOwnerAccountsHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[GetOwnerAccountsHandler] Created" << std::endl;
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
                auto ownerId = req.getQueryParam("owner_id").value_or("");
                if (ownerId.empty())
                {
                    sendError(res, 400, "owner_id query parameter is required");
                    return;
                }

                nlohmann::json accounts = nlohmann::json::array();
                for (const auto &account : accountService_->getOwnerAccounts(ownerId))
                {
                    accounts.push_back(accountToJson(account));
                }

                nlohmann::json response;
                response["owner_id"] = ownerId;
                response["accounts"] = accounts;
                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetOwnerAccountsHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace ledger::adapters::primary
