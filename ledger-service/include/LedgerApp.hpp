// include/LedgerApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/CacheSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/ExchangeRateSourceSettings.hpp"

// Ports
#include "ports/input/IAccountService.hpp"
#include "ports/input/ITransactionService.hpp"
#include "ports/input/IReconciliationService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IAuditLog.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IExchangeRateProvider.hpp"

// Application
#include "application/AccountLedger.hpp"
#include "application/AccountService.hpp"
#include "application/ExchangeRateService.hpp"
#include "application/LedgerReconciler.hpp"
#include "application/TransactionService.hpp"

// Secondary Adapters
#include "adapters/secondary/CachedExchangeRateProvider.hpp"
#include "adapters/secondary/HttpExchangeRateSource.hpp"
#include "adapters/secondary/PostgresAccountRepository.hpp"
#include "adapters/secondary/PostgresAuditLog.hpp"
#include "adapters/secondary/events/RabbitMQAdapter.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/OpenAccountHandler.hpp"
#include "adapters/primary/GetAccountHandler.hpp"
#include "adapters/primary/GetOwnerAccountsHandler.hpp"
#include "adapters/primary/CloseAccountHandler.hpp"
#include "adapters/primary/GetStatementHandler.hpp"
#include "adapters/primary/BalanceOperationHandler.hpp"
#include "adapters/primary/TransferHandler.hpp"
#include "adapters/primary/ReconciliationHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace ledger
{

    /**
     * @brief Ledger Service Application
     *
     * HTTP: счета, пополнения, списания, переводы, выписка, сверка
     * Курсы: primary/fallback HTTP API через TTL-кэш
     * Публикует: transaction.committed, transaction.failed (в ledger.events)
     */
    class LedgerApp : public BoostBeastApplication
    {
    public:
        LedgerApp() { std::cout << "[LedgerApp] Initializing..." << std::endl; }
        ~LedgerApp() override
        {
            if (rabbitMQAdapter_)
            {
                rabbitMQAdapter_->stop();
            }
            std::cout << "[LedgerApp] Shutting down..." << std::endl;
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[LedgerApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[LedgerApp] Configuring DI..." << std::endl;

            // Шаг 1: RabbitMQ publisher
            auto rabbitInjector = di::make_injector(
                di::bind<settings::RabbitMQSettings>().in(di::singleton));
            rabbitMQAdapter_ = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQAdapter>>();

            // Шаг 2: Два источника курсов одного типа собираются вручную
            auto httpClient = std::make_shared<HttpClient>();
            auto primary = std::make_shared<adapters::secondary::HttpExchangeRateSource>(
                httpClient,
                std::make_shared<settings::ExchangeRateSourceSettings>(settings::ExchangeRateSourceSettings::primary()));
            auto fallback = std::make_shared<adapters::secondary::HttpExchangeRateSource>(
                httpClient,
                std::make_shared<settings::ExchangeRateSourceSettings>(settings::ExchangeRateSourceSettings::fallback()));
            auto rateService = std::make_shared<application::ExchangeRateService>(primary, fallback);
            auto rates = std::make_shared<adapters::secondary::CachedExchangeRateProvider>(
                rateService, std::make_shared<settings::CacheSettings>());

            // Шаг 3: Основной injector
            auto injector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<settings::LedgerSettings>().in(di::singleton),

                di::bind<ports::output::IAccountRepository>()
                    .to<adapters::secondary::PostgresAccountRepository>()
                    .in(di::singleton),
                di::bind<ports::output::IAuditLog>()
                    .to<adapters::secondary::PostgresAuditLog>()
                    .in(di::singleton),
                di::bind<ports::output::IExchangeRateProvider>().to(
                    std::static_pointer_cast<ports::output::IExchangeRateProvider>(rates)),
                di::bind<ports::output::IEventPublisher>().to(
                    std::static_pointer_cast<ports::output::IEventPublisher>(rabbitMQAdapter_)),

                di::bind<application::AccountLedger>().in(di::singleton),
                di::bind<ports::input::ITransactionService>().to<application::TransactionService>().in(di::singleton),
                di::bind<ports::input::IAccountService>().to<application::AccountService>().in(di::singleton),
                di::bind<ports::input::IReconciliationService>().to<application::LedgerReconciler>().in(di::singleton));

            // Шаг 4: HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            handlers_[getHandlerKey("POST", "/api/v1/accounts")] =
                injector.create<std::shared_ptr<adapters::primary::OpenAccountHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/accounts")] =
                injector.create<std::shared_ptr<adapters::primary::GetOwnerAccountsHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/accounts/*")] =
                injector.create<std::shared_ptr<adapters::primary::GetAccountHandler>>();
            handlers_[getHandlerKey("DELETE", "/api/v1/accounts/*")] =
                injector.create<std::shared_ptr<adapters::primary::CloseAccountHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/transactions")] =
                injector.create<std::shared_ptr<adapters::primary::GetStatementHandler>>();

            auto transactionService = injector.create<std::shared_ptr<ports::input::ITransactionService>>();
            handlers_[getHandlerKey("POST", "/api/v1/deposits")] =
                std::make_shared<adapters::primary::BalanceOperationHandler>(
                    transactionService, adapters::primary::BalanceOperationHandler::Operation::DEPOSIT);
            handlers_[getHandlerKey("POST", "/api/v1/withdrawals")] =
                std::make_shared<adapters::primary::BalanceOperationHandler>(
                    transactionService, adapters::primary::BalanceOperationHandler::Operation::WITHDRAW);
            handlers_[getHandlerKey("POST", "/api/v1/transfers")] =
                injector.create<std::shared_ptr<adapters::primary::TransferHandler>>();

            handlers_[getHandlerKey("GET", "/api/v1/reconciliation")] =
                injector.create<std::shared_ptr<adapters::primary::ReconciliationHandler>>();

            // Шаг 5: RabbitMQ после регистрации handlers
            std::cout << "[LedgerApp] Starting RabbitMQ..." << std::endl;
            rabbitMQAdapter_->start();

            std::cout << "[LedgerApp] Ready" << std::endl;
        }

    private:
        std::shared_ptr<adapters::secondary::RabbitMQAdapter> rabbitMQAdapter_;
    };

} // namespace ledger
