// src/LedgerApp.cpp
#include "LedgerApp.hpp"

#include "adapters/secondary/memory/InMemoryLedgerStore.hpp"
#include "adapters/secondary/memory/InMemoryDeadLetterSink.hpp"
#include "adapters/secondary/postgres/PostgresLedgerUnitOfWork.hpp"
#include "adapters/secondary/postgres/PostgresAccountCatalog.hpp"
#include "adapters/secondary/postgres/PostgresDeadLetterRepository.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace di = boost::di;

namespace ledger
{

    namespace
    {
        nlohmann::json reportToJson(const domain::BalanceHealthReport &report)
        {
            nlohmann::json drifts = nlohmann::json::array();
            for (const auto &drift : report.drifts)
            {
                drifts.push_back({{"account_id", drift.accountId},
                                  {"code", drift.code},
                                  {"materialized", drift.materialized.toString()},
                                  {"recomputed", drift.recomputed.toString()},
                                  {"difference", drift.difference().toString()}});
            }

            return {{"checked_at", report.checkedAt.toString()},
                    {"healthy", report.isHealthy()},
                    {"equation_holds", report.equationHolds},
                    {"equation_difference", report.equationDifference().toString()},
                    {"total_assets", report.totalAssets.toString()},
                    {"total_liabilities", report.totalLiabilities.toString()},
                    {"total_equity", report.totalEquity.toString()},
                    {"total_revenue", report.totalRevenue.toString()},
                    {"total_expenses", report.totalExpenses.toString()},
                    {"healed_accounts", report.healedAccounts},
                    {"drifts", drifts}};
        }
    } // namespace

    LedgerApp::LedgerApp() { std::cout << "[LedgerApp] Initializing..." << std::endl; }

    LedgerApp::~LedgerApp() { std::cout << "[LedgerApp] Shutting down..." << std::endl; }

    int LedgerApp::run(int argc, char *argv[])
    {
        loadEnvironment(argc, argv);
        configureInjection();

        if (command_ == "health" || command_ == "heal")
        {
            return runHealthCommand(command_ == "heal");
        }

        serve();
        return 0;
    }

    void LedgerApp::stop()
    {
        stopRequested_ = true;
    }

    void LedgerApp::loadEnvironment(int argc, char *argv[])
    {
        if (argc > 1)
        {
            command_ = argv[1];
            if (command_ != "health" && command_ != "heal")
            {
                throw std::invalid_argument("Unknown command: " + command_ + " (expected: health, heal)");
            }
        }

        dbSettings_ = std::make_shared<settings::DbSettings>();
        cacheSettings_ = std::make_shared<settings::CacheSettings>();
        ledgerSettings_ = std::make_shared<settings::LedgerSettings>();
        rabbitSettings_ = std::make_shared<settings::RabbitMQSettings>();

        std::cout << "[LedgerApp] Environment loaded, storage=" << ledgerSettings_->getStorage() << std::endl;
    }

    void LedgerApp::configureInjection()
    {
        std::cout << "[LedgerApp] Configuring DI..." << std::endl;

        // Шаг 1: Хранилище по LEDGER_STORAGE
        std::shared_ptr<ports::output::ILedgerUnitOfWork> unitOfWork;
        std::shared_ptr<ports::output::IAccountCatalog> catalogDelegate;
        std::shared_ptr<ports::output::IDeadLetterSink> deadLetters;

        if (ledgerSettings_->getStorage() == "memory")
        {
            auto store = std::make_shared<adapters::secondary::InMemoryLedgerStore>(ledgerSettings_);
            store->seedDefaultChart();
            unitOfWork = store;
            catalogDelegate = store;
            deadLetters = std::make_shared<adapters::secondary::InMemoryDeadLetterSink>();
        }
        else if (ledgerSettings_->getStorage() == "postgres")
        {
            unitOfWork = std::make_shared<adapters::secondary::PostgresLedgerUnitOfWork>(dbSettings_, ledgerSettings_);
            catalogDelegate = std::make_shared<adapters::secondary::PostgresAccountCatalog>(dbSettings_);
            deadLetters = std::make_shared<adapters::secondary::PostgresDeadLetterRepository>(dbSettings_);
        }
        else
        {
            throw std::invalid_argument("Unknown LEDGER_STORAGE: " + ledgerSettings_->getStorage());
        }

        // Декоратор кэша поверх каталога счетов
        std::shared_ptr<ports::output::IAccountCatalog> accountCatalog =
            std::make_shared<adapters::secondary::CachedAccountCatalog>(catalogDelegate, cacheSettings_);

        // Шаг 2: RabbitMQAdapter (один экземпляр для Publisher и Consumer)
        auto rabbitInjector = di::make_injector(
            di::bind<settings::RabbitMQSettings>().to(rabbitSettings_));
        rabbitMQAdapter_ = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQAdapter>>();

        // Шаг 3: Основной injector с instance binding
        auto injector = di::make_injector(
            di::bind<settings::DbSettings>().to(dbSettings_),
            di::bind<settings::CacheSettings>().to(cacheSettings_),
            di::bind<settings::LedgerSettings>().to(ledgerSettings_),
            di::bind<settings::RabbitMQSettings>().to(rabbitSettings_),

            di::bind<ports::output::ILedgerUnitOfWork>().to(unitOfWork),
            di::bind<ports::output::IAccountCatalog>().to(accountCatalog),
            di::bind<ports::output::IDeadLetterSink>().to(deadLetters),

            // RabbitMQ - один экземпляр для обоих интерфейсов
            di::bind<ports::output::IEventPublisher>().to(rabbitMQAdapter_),
            di::bind<ports::output::IEventConsumer>().to(rabbitMQAdapter_),

            di::bind<ports::input::IJournalService>().to<application::JournalPostingEngine>().in(di::singleton),
            di::bind<ports::input::ILedgerQueryService>().to<application::LedgerQueryService>().in(di::singleton),
            di::bind<ports::input::IBalanceHealthService>().to<application::BalanceHealthService>().in(di::singleton),
            di::bind<application::JournalPostingQueue>().in(di::singleton));

        healthService_ = injector.create<std::shared_ptr<ports::input::IBalanceHealthService>>();
        postingQueue_ = injector.create<std::shared_ptr<application::JournalPostingQueue>>();
        reconciliationJob_ = injector.create<std::shared_ptr<application::BalanceReconciliationJob>>();

        // Шаг 4: Слушатель документов (subscribe() в конструкторе)
        sourceEventListener_ = injector.create<std::shared_ptr<adapters::primary::SourceEventListener>>();

        std::cout << "[LedgerApp] DI configured" << std::endl;
    }

    void LedgerApp::serve()
    {
        postingQueue_->start();
        reconciliationJob_->start();

        // Шаг 5: RabbitMQ ПОСЛЕ регистрации всех handlers
        std::cout << "[LedgerApp] Starting RabbitMQ..." << std::endl;
        rabbitMQAdapter_->start();

        std::cout << "[LedgerApp] Ready (events via RabbitMQ)" << std::endl;

        while (!stopRequested_)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        // Сначала перестаём принимать события, затем даём очереди доработать;
        // что не успело - уйдёт в dead-letter в stop()
        rabbitMQAdapter_->stop();
        reconciliationJob_->stop();
        if (!postingQueue_->waitUntilIdle(std::chrono::seconds(10)))
        {
            std::cerr << "[LedgerApp] Posting queue is not idle, pending tasks go to dead-letter" << std::endl;
        }
        postingQueue_->stop();

        std::cout << "[LedgerApp] Stopped: completed=" << postingQueue_->completedCount()
                  << " retried=" << postingQueue_->retriedCount()
                  << " dead-lettered=" << postingQueue_->deadLetteredCount() << std::endl;
    }

    int LedgerApp::runHealthCommand(bool heal)
    {
        auto report = heal ? healthService_->autoHeal() : healthService_->checkHealth();
        std::cout << reportToJson(report).dump(2) << std::endl;
        return (report.isHealthy() || (heal && report.equationHolds)) ? 0 : 2;
    }

} // namespace ledger
