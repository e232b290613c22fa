#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpMapping.hpp"
#include "ports/input/IAccountService.hpp"
#include <memory>
#include <iostream>

namespace ledger::adapters::primary
{

    /**
     * @brief GET /api/v1/accounts/{id}: счёт по ID
     *
     * Роутер регистрирует с паттерном "/api/v1/accounts/*"
     */
    class GetAccountHandler : public IHttpHandler
    {
    public:
        explicit GetAccountHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[GetAccountHandler] Created" << std::endl;
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
                std::string accountId = req.getPathParam(0).value_or("");
                if (accountId.empty())
                {
                    sendError(res, 400, "Account ID is required");
                    return;
                }

                auto account = accountService_->getAccount(accountId);
                if (!account)
                {
                    sendError(res, 404, "Account not found");
                    return;
                }

                res.setResult(200, "application/json", accountToJson(*account).dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetAccountHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace ledger::adapters::primary
