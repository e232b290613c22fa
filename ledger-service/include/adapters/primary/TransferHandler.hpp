#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpMapping.hpp"
#include "ports/input/ITransactionService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace ledger::adapters::primary
{

    /**
     * @brief POST /api/v1/transfers: перевод между счетами
     *
     * Header: X-Idempotency-Key
     * Body: {"source_account_id": "...", "destination_account_id": "...",
     *        "amount": "100.00", "currency": "USD", "description": "...", "timeout_ms": 2000}
     *
     * currency должна совпадать с валютой счёта-источника.
     */
    class TransferHandler : public IHttpHandler
    {
    public:
        explicit TransferHandler(std::shared_ptr<ports::input::ITransactionService> transactionService)
            : transactionService_(std::move(transactionService))
        {
            std::cout << "[TransferHandler] Created" << std::endl;
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

                domain::TransferRequest request;
                request.sourceAccountId = body.value("source_account_id", "");
                request.destinationAccountId = body.value("destination_account_id", "");
                if (request.sourceAccountId.empty() || request.destinationAccountId.empty())
                {
                    sendError(res, 400, "source_account_id and destination_account_id are required");
                    return;
                }
                std::string currency = body.value("currency", "");
                if (currency.empty())
                {
                    sendError(res, 400, "currency is required");
                    return;
                }

                request.amount = moneyFromJson(body, "amount", currency);
                request.idempotencyKey = idempotencyKeyOf(req, body);
                request.description = body.value("description", "");
                request.deadline = deadlineOf(body);

                auto result = transactionService_->transfer(request);

                nlohmann::json response;
                response["transaction_id"] = result.transactionId;
                response["source_balance"] = moneyToJson(result.sourceBalance);
                response["destination_balance"] = moneyToJson(result.destinationBalance);
                response["debit"] = moneyToJson(result.debit);
                response["credit"] = moneyToJson(result.credit);
                response["applied_rate"] = result.appliedRate.toString();
                response["rate_source"] = domain::toString(result.rateSource);
                response["replayed"] = result.replayed;
                response["timestamp"] = result.timestamp.toString();

                res.setResult(result.replayed ? 200 : 201, "application/json", response.dump());
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
                std::cerr << "[TransferHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ITransactionService> transactionService_;
    };

} // namespace ledger::adapters::primary
