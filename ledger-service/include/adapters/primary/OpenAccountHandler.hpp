#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpMapping.hpp"
#include "ports/input/IAccountService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace ledger::adapters::primary
{

    /**
     * @brief POST /api/v1/accounts: открыть счёт
     *
     * Body: {"owner_id": "...", "currency": "USD", "initial_balance": "100.00", "account_id": "..."}
     * account_id необязателен.
     */
    class OpenAccountHandler : public IHttpHandler
    {
    public:
        explicit OpenAccountHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[OpenAccountHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto body = nlohmann::json::parse(req.getBody());

                std::string ownerId = body.value("owner_id", "");
                std::string currency = body.value("currency", "");
                if (ownerId.empty())
                {
                    sendError(res, 400, "owner_id is required");
                    return;
                }
                if (currency.empty())
                {
                    sendError(res, 400, "currency is required");
                    return;
                }

                auto initial = body.contains("initial_balance")
                                   ? moneyFromJson(body, "initial_balance", currency)
                                   : domain::Money::zero(currency);

                auto account = accountService_->openAccount(
                    body.value("account_id", ""), ownerId, currency, initial);

                res.setResult(201, "application/json", accountToJson(account).dump());
            }
            catch (const nlohmann::json::exception &e)
            {
                sendError(res, 400, "Invalid JSON");
            }
            catch (const domain::LedgerException &e)
            {
                sendLedgerError(res, e);
            }
            catch (const std::invalid_argument &e)
            {
                sendError(res, 400, e.what());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[OpenAccountHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace ledger::adapters::primary
