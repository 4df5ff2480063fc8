// include/LedgerApp.hpp
#pragma once

#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/CacheSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include "settings/RabbitMQSettings.hpp"

// Ports
#include "ports/input/IJournalService.hpp"
#include "ports/input/ILedgerQueryService.hpp"
#include "ports/input/IBalanceHealthService.hpp"
#include "ports/output/ILedgerUnitOfWork.hpp"
#include "ports/output/IAccountCatalog.hpp"
#include "ports/output/IDeadLetterSink.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"

// Application
#include "application/JournalPostingEngine.hpp"
#include "application/LedgerQueryService.hpp"
#include "application/BalanceHealthService.hpp"
#include "application/BalanceReconciliationJob.hpp"
#include "application/JournalPostingQueue.hpp"

// Secondary Adapters
#include "adapters/secondary/CachedAccountCatalog.hpp"
#include "adapters/secondary/events/RabbitMQAdapter.hpp"

// Primary Adapters
#include "adapters/primary/SourceEventListener.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace ledger
{

    /**
     * @brief Ledger Service Application (Event-Driven)
     *
     * Слушает: sales.invoiced, purchase.approved, payment.recorded (ledger.events)
     * Публикует: journal.posted, journal.reversed
     * Фоном: очередь проводок и сверка остатков
     *
     * Аргументы:
     *   (нет)    - сервис, работает до stop()
     *   health   - одна проверка остатков, отчёт в stdout (JSON), код 0/2
     *   heal     - проверка с исправлением расхождений
     */
    class LedgerApp
    {
    public:
        LedgerApp();
        ~LedgerApp();

        /**
         * @brief Template Method: loadEnvironment -> configureInjection -> serve / разовая команда
         * @return код завершения процесса
         */
        int run(int argc, char *argv[]);

        /**
         * @brief Остановить сервис (безопасно из обработчика сигнала)
         */
        void stop();

    protected:
        void loadEnvironment(int argc, char *argv[]);
        void configureInjection();
        void serve();
        int runHealthCommand(bool heal);

    private:
        std::string command_;

        std::shared_ptr<settings::DbSettings> dbSettings_;
        std::shared_ptr<settings::CacheSettings> cacheSettings_;
        std::shared_ptr<settings::LedgerSettings> ledgerSettings_;
        std::shared_ptr<settings::RabbitMQSettings> rabbitSettings_;

        std::shared_ptr<adapters::secondary::RabbitMQAdapter> rabbitMQAdapter_;
        std::shared_ptr<ports::input::IBalanceHealthService> healthService_;
        std::shared_ptr<application::JournalPostingQueue> postingQueue_;
        std::shared_ptr<application::BalanceReconciliationJob> reconciliationJob_;
        std::shared_ptr<adapters::primary::SourceEventListener> sourceEventListener_;

        std::atomic<bool> stopRequested_{false};
    };

} // namespace ledger
