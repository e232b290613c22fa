#pragma once

#include <IRequest.hpp>
#include <IResponse.hpp>
#include "domain/Account.hpp"
#include "domain/LedgerException.hpp"
#include "domain/TransferRequest.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace ledger::adapters::primary
{

    /**
     * @brief Код LedgerException -> HTTP статус
     */
    inline int httpStatusFor(domain::ErrorCode code)
    {
        switch (code)
        {
        case domain::ErrorCode::ACCOUNT_NOT_FOUND:
            return 404;
        case domain::ErrorCode::ACCOUNT_CLOSED:
        case domain::ErrorCode::CONCURRENCY_CONFLICT:
            return 409;
        case domain::ErrorCode::INSUFFICIENT_FUNDS:
            return 422;
        case domain::ErrorCode::INVALID_TRANSFER:
            return 400;
        case domain::ErrorCode::RATE_UNAVAILABLE:
        case domain::ErrorCode::REQUEST_EXPIRED:
        case domain::ErrorCode::STORE_UNAVAILABLE:
            return 503;
        default:
            return 500;
        }
    }

    inline void sendError(IResponse &res, int status, const std::string &message)
    {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }

    inline void sendLedgerError(IResponse &res, const domain::LedgerException &e)
    {
        nlohmann::json error;
        error["error"] = e.what();
        error["code"] = domain::toString(e.code());
        error["stage"] = domain::toString(e.stage());
        if (!e.accountId().empty())
        {
            error["account_id"] = e.accountId();
        }
        res.setResult(httpStatusFor(e.code()), "application/json", error.dump());
    }

    inline nlohmann::json moneyToJson(const domain::Money &money)
    {
        return {{"amount", money.toString()}, {"currency", money.currency}};
    }

    inline nlohmann::json accountToJson(const domain::Account &account)
    {
        nlohmann::json j;
        j["account_id"] = account.accountId;
        j["owner_id"] = account.ownerId;
        j["currency"] = account.currency;
        j["balance"] = account.balance.toString();
        j["version"] = account.version;
        j["closed"] = account.closed;
        j["opened_at"] = account.openedAt.toString();
        return j;
    }

    /**
     * @brief Сумма из поля field: строка "10.50" или число 10.50
     *
     * Число приходит из nlohmann::json уже как double и переводится
     * в текст через dump(). Точные суммы клиенту следует передавать строкой.
     * @throws std::invalid_argument если поле отсутствует или не является суммой
     */
    inline domain::Money moneyFromJson(const nlohmann::json &body, const std::string &field, const std::string &currency)
    {
        if (!body.contains(field))
        {
            throw std::invalid_argument("Field '" + field + "' is required");
        }
        const auto &value = body.at(field);
        if (value.is_string())
        {
            return domain::Money::fromString(value.get<std::string>(), currency);
        }
        if (value.is_number())
        {
            return domain::Money::fromString(value.dump(), currency);
        }
        throw std::invalid_argument("Field '" + field + "' must be a decimal amount");
    }

    /**
     * @brief Idempotency key: заголовок X-Idempotency-Key, иначе поле тела
     */
    inline std::string idempotencyKeyOf(IRequest &req, const nlohmann::json &body)
    {
        auto header = req.getHeader("X-Idempotency-Key");
        if (header && !header->empty())
        {
            return *header;
        }
        return body.value("idempotency_key", "");
    }

    /**
     * @brief Дедлайн захвата блокировок из поля timeout_ms
     */
    inline std::optional<domain::Deadline> deadlineOf(const nlohmann::json &body)
    {
        if (!body.contains("timeout_ms") || !body.at("timeout_ms").is_number_integer())
        {
            return std::nullopt;
        }
        return std::chrono::steady_clock::now() + std::chrono::milliseconds(body.at("timeout_ms").get<int64_t>());
    }

} // namespace ledger::adapters::primary
