#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpMapping.hpp"
#include "ports/input/IAccountService.hpp"
#include <memory>
#include <iostream>

namespace ledger::adapters::primary
{

    /**
     * @brief DELETE /api/v1/accounts/{id}: закрыть счёт
     *
     * Счёт не удаляется: баланс замораживается, дальнейшие операции
     * получают ACCOUNT_CLOSED.
     */
    class CloseAccountHandler : public IHttpHandler
    {
    public:
        explicit CloseAccountHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[CloseAccountHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "DELETE")
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

                auto account = accountService_->closeAccount(accountId);
                res.setResult(200, "application/json", accountToJson(account).dump());
            }
            catch (const domain::LedgerException &e)
            {
                sendLedgerError(res, e);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[CloseAccountHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace ledger::adapters::primary
