// include/EmulatorApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/StorageSettings.hpp"
#include "settings/TokenSettings.hpp"
#include "settings/LoginFlowSettings.hpp"

// Ports
#include "ports/input/ITokenService.hpp"
#include "ports/input/IAuthorizationFlowService.hpp"
#include "ports/input/IReferenceDataService.hpp"
#include "ports/input/IWalletTxnService.hpp"
#include "ports/input/IDealService.hpp"
#include "ports/input/IJournalService.hpp"
#include "ports/input/IReceiptService.hpp"
#include "ports/output/Collections.hpp"

// Application
#include "application/TokenService.hpp"
#include "application/AuthorizationFlowService.hpp"
#include "application/ReferenceDataService.hpp"
#include "application/WalletTxnService.hpp"
#include "application/SettlementEngine.hpp"
#include "application/DealService.hpp"
#include "application/JournalService.hpp"
#include "application/ReceiptService.hpp"

// Secondary Adapters
#include "adapters/secondary/storage/SqliteKeyValueStore.hpp"
#include "adapters/secondary/persistence/KvRecordRepository.hpp"
#include "adapters/secondary/persistence/KvUnitOfWork.hpp"
#include "adapters/secondary/persistence/InMemoryReferenceDataRepository.hpp"
#include "adapters/secondary/files/LocalReceiptFileStore.hpp"

// Primary Adapters
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/BearerAuthMiddleware.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/oauth/TokenHandler.hpp"
#include "adapters/primary/oauth/RevokeTokenHandler.hpp"
#include "adapters/primary/oauth/AuthorizationFlowHandler.hpp"
#include "adapters/primary/api/CompaniesHandler.hpp"
#include "adapters/primary/api/AccountItemsHandler.hpp"
#include "adapters/primary/api/WalletablesHandler.hpp"
#include "adapters/primary/api/WalletTxnsHandler.hpp"
#include "adapters/primary/api/DealsHandler.hpp"
#include "adapters/primary/api/JournalsHandler.hpp"
#include "adapters/primary/api/ReceiptsHandler.hpp"

#include <iostream>
#include <memory>
#include <initializer_list>

namespace di = boost::di;

namespace emulator
{

    /**
     * @brief Эмулятор бухгалтерского SaaS API
     *
     * OAuth2 (token, revoke, трёхшаговый вход через HTML), справочники,
     * wallet_txns, deals с автоматической сверкой, journals, receipts.
     * Все записи хранятся во встроенном KV-хранилище поверх SQLite.
     */
    class EmulatorApp : public BoostBeastApplication
    {
    public:
        EmulatorApp() { std::cout << "[EmulatorApp] Initializing..." << std::endl; }
        ~EmulatorApp() override { std::cout << "[EmulatorApp] Shutting down..." << std::endl; }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[EmulatorApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[EmulatorApp] Configuring DI..." << std::endl;

            // Шаг 1: Настройки (у каждой два конструктора, поэтому instance binding)
            auto storageSettings = std::make_shared<settings::StorageSettings>();
            auto tokenSettings = std::make_shared<settings::TokenSettings>();
            auto loginSettings = std::make_shared<settings::LoginFlowSettings>();

            // Шаг 2: Хранилище открывается один раз, коллекции объявляются до первого запроса
            std::cout << "[EmulatorApp] Opening store: " << storageSettings->getDbPath() << std::endl;
            auto store = std::make_shared<adapters::secondary::storage::SqliteKeyValueStore>(
                storageSettings->getDbPath());
            ports::output::collections::declareAll(*store);

            // Шаг 3: Основной injector
            auto injector = di::make_injector(
                di::bind<settings::StorageSettings>().to(storageSettings),
                di::bind<settings::TokenSettings>().to(tokenSettings),
                di::bind<settings::LoginFlowSettings>().to(loginSettings),

                di::bind<ports::output::IKeyValueStore>().to(store),
                di::bind<ports::output::IUnitOfWork>()
                    .to<adapters::secondary::persistence::KvUnitOfWork>()
                    .in(di::singleton),

                di::bind<ports::output::IRecordRepository<domain::WalletTxn>>()
                    .to<adapters::secondary::persistence::KvRecordRepository<domain::WalletTxn>>()
                    .in(di::singleton),
                di::bind<ports::output::IRecordRepository<domain::Deal>>()
                    .to<adapters::secondary::persistence::KvRecordRepository<domain::Deal>>()
                    .in(di::singleton),
                di::bind<ports::output::IRecordRepository<domain::Journal>>()
                    .to<adapters::secondary::persistence::KvRecordRepository<domain::Journal>>()
                    .in(di::singleton),
                di::bind<ports::output::IRecordRepository<domain::Receipt>>()
                    .to<adapters::secondary::persistence::KvRecordRepository<domain::Receipt>>()
                    .in(di::singleton),

                di::bind<ports::output::IReferenceDataRepository>()
                    .to<adapters::secondary::persistence::InMemoryReferenceDataRepository>()
                    .in(di::singleton),
                di::bind<ports::output::IReceiptFileStore>()
                    .to<adapters::secondary::files::LocalReceiptFileStore>()
                    .in(di::singleton),

                di::bind<application::SettlementEngine>().in(di::singleton),

                di::bind<ports::input::ITokenService>().to<application::TokenService>().in(di::singleton),
                di::bind<ports::input::IAuthorizationFlowService>().to<application::AuthorizationFlowService>().in(di::singleton),
                di::bind<ports::input::IReferenceDataService>().to<application::ReferenceDataService>().in(di::singleton),
                di::bind<ports::input::IWalletTxnService>().to<application::WalletTxnService>().in(di::singleton),
                di::bind<ports::input::IDealService>().to<application::DealService>().in(di::singleton),
                di::bind<ports::input::IJournalService>().to<application::JournalService>().in(di::singleton),
                di::bind<ports::input::IReceiptService>().to<application::ReceiptService>().in(di::singleton));

            // Шаг 4: HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            // OAuth (без Bearer)
            handlers_[getHandlerKey("POST", "/oauth/token")] =
                injector.create<std::shared_ptr<adapters::primary::oauth::TokenHandler>>();
            handlers_[getHandlerKey("POST", "/oauth/revoke")] =
                injector.create<std::shared_ptr<adapters::primary::oauth::RevokeTokenHandler>>();

            auto loginFlowHandler = injector.create<std::shared_ptr<adapters::primary::oauth::AuthorizationFlowHandler>>();
            handlers_[getHandlerKey("GET", "/oauth/authorize")] = loginFlowHandler;
            handlers_[getHandlerKey("POST", "/oauth/authorize/login")] = loginFlowHandler;
            handlers_[getHandlerKey("POST", "/oauth/authorize/2fa")] = loginFlowHandler;
            handlers_[getHandlerKey("POST", "/oauth/authorize/confirm")] = loginFlowHandler;
            std::cout << "  ✓ OAuth: /oauth/token, /oauth/revoke, /oauth/authorize/*" << std::endl;

            // API (Bearer middleware → handler)
            auto auth = injector.create<std::shared_ptr<adapters::primary::BearerAuthMiddleware>>();
            auto secured = [&auth](std::shared_ptr<IHttpHandler> handler)
            {
                return std::make_shared<adapters::primary::ChainHandler>(auth, std::move(handler));
            };

            handlers_[getHandlerKey("GET", "/api/1/companies")] =
                secured(injector.create<std::shared_ptr<adapters::primary::api::CompaniesHandler>>());
            handlers_[getHandlerKey("GET", "/api/1/account_items")] =
                secured(injector.create<std::shared_ptr<adapters::primary::api::AccountItemsHandler>>());
            handlers_[getHandlerKey("GET", "/api/1/walletables")] =
                secured(injector.create<std::shared_ptr<adapters::primary::api::WalletablesHandler>>());
            std::cout << "  ✓ Reference data: GET /api/1/companies, /api/1/account_items, /api/1/walletables" << std::endl;

            registerResource("/api/1/wallet_txns",
                             secured(injector.create<std::shared_ptr<adapters::primary::api::WalletTxnsHandler>>()),
                             {"GET", "PUT", "DELETE"});
            registerResource("/api/1/deals",
                             secured(injector.create<std::shared_ptr<adapters::primary::api::DealsHandler>>()),
                             {"GET", "PUT", "DELETE"});
            registerResource("/api/1/journals",
                             secured(injector.create<std::shared_ptr<adapters::primary::api::JournalsHandler>>()),
                             {"GET"});
            registerResource("/api/1/receipts",
                             secured(injector.create<std::shared_ptr<adapters::primary::api::ReceiptsHandler>>()),
                             {"GET", "DELETE"});

            std::cout << "[EmulatorApp] Ready - " << handlers_.size() << " routes registered" << std::endl;
        }

    private:
        /**
         * @brief GET/POST на коллекцию и перечисленные методы на элемент (path/*)
         */
        void registerResource(const std::string &path,
                              const std::shared_ptr<IHttpHandler> &handler,
                              std::initializer_list<const char *> itemMethods)
        {
            handlers_[getHandlerKey("GET", path)] = handler;
            handlers_[getHandlerKey("POST", path)] = handler;

            std::string methods = "GET/POST";
            for (const char *method : itemMethods)
            {
                handlers_[getHandlerKey(method, path + "/*")] = handler;
                methods += std::string(" ") + method + " /*";
            }

            std::cout << "  ✓ " << path << ": " << methods << std::endl;
        }
    };

} // namespace emulator
