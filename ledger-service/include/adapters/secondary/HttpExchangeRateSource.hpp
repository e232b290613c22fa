#pragma once

#include "ports/output/IExchangeRateSource.hpp"
#include "settings/IExchangeRateSourceSettings.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief HTTP клиент к API курсов
 *
 * GET /api/v1/rate?from=X&to=Y -> {"rate": 0.85, "timestamp": 1700000000000}
 *
 * 404 означает, что направление не поддерживается: тогда запрашивается
 * обратная пара и курс обращается (1/R, half-even до 1e-9).
 * Любая другая ошибка возвращается как nullopt.
 */
class HttpExchangeRateSource : public ports::output::IExchangeRateSource {
public:
    HttpExchangeRateSource(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IExchangeRateSourceSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpExchangeRateSource] Created " << settings_->getName() << ", target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    std::optional<domain::ExchangeRate> fetchRate(
        const std::string& fromCurrency,
        const std::string& toCurrency) override
    {
        try {
            auto response = doGet(ratePath(fromCurrency, toCurrency));

            if (response.getStatus() == 404) {
                return fetchInverse(fromCurrency, toCurrency);
            }
            if (response.getStatus() < 200 || response.getStatus() >= 300) {
                std::cerr << "[HttpExchangeRateSource] " << settings_->getName()
                          << " getRate failed: " << response.getStatus() << std::endl;
                return std::nullopt;
            }

            auto json = nlohmann::json::parse(response.getBody());
            return parseRate(json, fromCurrency, toCurrency);
        } catch (const std::exception& e) {
            std::cerr << "[HttpExchangeRateSource] " << settings_->getName()
                      << " getRate error: " << e.what() << std::endl;
        }

        return std::nullopt;
    }

    std::string name() const override {
        return settings_->getName();
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IExchangeRateSourceSettings> settings_;

    static std::string ratePath(const std::string& fromCurrency, const std::string& toCurrency) {
        return "/api/v1/rate?from=" + fromCurrency + "&to=" + toCurrency;
    }

    std::optional<domain::ExchangeRate> fetchInverse(
        const std::string& fromCurrency,
        const std::string& toCurrency)
    {
        auto response = doGet(ratePath(toCurrency, fromCurrency));
        if (response.getStatus() != 200) {
            std::cerr << "[HttpExchangeRateSource] " << settings_->getName() << " has neither "
                      << fromCurrency << "/" << toCurrency << " nor the reverse pair" << std::endl;
            return std::nullopt;
        }

        auto json = nlohmann::json::parse(response.getBody());
        auto reverse = parseRate(json, toCurrency, fromCurrency);
        if (!reverse) {
            return std::nullopt;
        }

        domain::ExchangeRate rate = *reverse;
        rate.fromCurrency = fromCurrency;
        rate.toCurrency = toCurrency;
        rate.rate = reverse->rate.reciprocal();
        return rate;
    }

    /**
     * @brief Разобрать {"rate": ..., "timestamp": ...}
     *
     * Строковый курс разбирается как есть. Числовой уже прошёл через double
     * в nlohmann::json, dump() может дать экспоненту ("2.2e-05"),
     * Rate::fromString её принимает.
     */
    std::optional<domain::ExchangeRate> parseRate(
        const nlohmann::json& j,
        const std::string& fromCurrency,
        const std::string& toCurrency) const
    {
        if (!j.is_object() || !j.contains("rate")) {
            std::cerr << "[HttpExchangeRateSource] " << settings_->getName()
                      << " malformed payload: " << j.dump() << std::endl;
            return std::nullopt;
        }

        const auto& value = j.at("rate");
        std::string text;
        if (value.is_string()) {
            text = value.get<std::string>();
        } else if (value.is_number()) {
            text = value.dump();
        } else {
            return std::nullopt;
        }

        domain::ExchangeRate rate;
        rate.fromCurrency = fromCurrency;
        rate.toCurrency = toCurrency;
        rate.rate = domain::Rate::fromString(text);
        if (!rate.rate.isPositive()) {
            return std::nullopt;
        }

        if (j.contains("timestamp") && j.at("timestamp").is_number_integer()) {
            rate.fetchedAt = domain::Timestamp::fromEpochMillis(j.at("timestamp").get<int64_t>());
        } else {
            rate.fetchedAt = domain::Timestamp::now();
        }
        return rate;
    }

    SimpleResponse doGet(const std::string& path) {
        SimpleRequest request(
            "GET",
            path,
            "",
            settings_->getHost(),
            settings_->getPort(),
            {}
        );

        SimpleResponse response;
        bool sent = httpClient_->send(request, response);
        if (!sent && response.getStatus() == 0) {
            throw std::runtime_error("request to " + settings_->getHost() + " failed");
        }
        return response;
    }
};

} // namespace ledger::adapters::secondary
