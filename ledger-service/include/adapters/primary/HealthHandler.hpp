#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/output/IExchangeRateProvider.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace ledger::adapters::primary {

/**
 * @brief GET /health
 *
 * Сервис отвечает 200 и при работе на резервном источнике курсов,
 * но помечает состояние как degraded.
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<ports::output::IExchangeRateProvider> rates)
        : rates_(std::move(rates)) {}

    void handle(IRequest& req, IResponse& res) override {
        const std::string source = rates_->currentSourceName();

        nlohmann::json body = {
            {"service", "ledger-service"},
            {"status", source == "fallback" ? "degraded" : "healthy"},
            {"rate_source", source}
        };
        res.setResult(200, "application/json", body.dump());
    }

private:
    std::shared_ptr<ports::output::IExchangeRateProvider> rates_;
};

} // namespace ledger::adapters::primary
