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
     * @brief POST /api/v1/deposits и POST /api/v1/withdrawals
     *
     * Header: X-Idempotency-Key
     * Body: {"account_id": "...", "amount": "10.00", "currency": "USD",
     *        "expected_version": 7, "description": "...", "timeout_ms": 2000}
     *
     * Сумма в другой валюте конвертируется в валюту счёта по текущему курсу.
     */
    class BalanceOperationHandler : public IHttpHandler
    {
    public:
        enum class Operation
        {
            DEPOSIT,
            WITHDRAW
        };

        BalanceOperationHandler(
            std::shared_ptr<ports::input::ITransactionService> transactionService,
            Operation operation)
            : transactionService_(std::move(transactionService)), operation_(operation)
        {
            std::cout << "[BalanceOperationHandler] Created for "
                      << (operation_ == Operation::DEPOSIT ? "deposits" : "withdrawals") << std::endl;
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

                domain::BalanceRequest request;
                request.accountId = body.value("account_id", "");
                if (request.accountId.empty())
                {
                    sendError(res, 400, "account_id is required");
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
                if (body.contains("expected_version") && body.at("expected_version").is_number_unsigned())
                {
                    request.expectedVersion = body.at("expected_version").get<uint64_t>();
                }

                auto result = operation_ == Operation::DEPOSIT
                                  ? transactionService_->deposit(request)
                                  : transactionService_->withdraw(request);

                nlohmann::json response;
                response["transaction_id"] = result.transactionId;
                response["account_id"] = result.accountId;
                response["new_balance"] = moneyToJson(result.newBalance);
                response["applied"] = moneyToJson(result.applied);
                response["applied_rate"] = result.appliedRate.toString();
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
                std::cerr << "[BalanceOperationHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ITransactionService> transactionService_;
        Operation operation_;
    };

} // namespace ledger::adapters::primary
