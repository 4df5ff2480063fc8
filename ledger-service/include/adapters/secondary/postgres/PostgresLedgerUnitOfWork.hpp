#pragma once

#include "ports/output/ILedgerUnitOfWork.hpp"
#include "adapters/secondary/postgres/PostgresLedgerSession.hpp"
#include "adapters/secondary/postgres/PostgresLedgerSchema.hpp"
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief Транзакции журнала в PostgreSQL
 *
 * Каждая сессия открывает своё соединение. При создании
 * накатывает схему (CREATE ... IF NOT EXISTS).
 */
class PostgresLedgerUnitOfWork : public ports::output::ILedgerUnitOfWork {
public:
    PostgresLedgerUnitOfWork(
        std::shared_ptr<settings::DbSettings> dbSettings,
        std::shared_ptr<settings::LedgerSettings> ledgerSettings
    ) : dbSettings_(std::move(dbSettings))
      , ledgerSettings_(std::move(ledgerSettings))
    {
        std::cout << "[PostgresLedgerUnitOfWork] Connecting to " << dbSettings_->getHost() << ":"
                  << dbSettings_->getPort() << "/" << dbSettings_->getName() << std::endl;
        initSchema();
    }

    std::unique_ptr<ports::output::ILedgerSession> begin() override {
        try {
            return std::make_unique<PostgresLedgerSession>(dbSettings_->getConnectionString(),
                                                           ledgerSettings_->getLockTimeout());
        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresLedgerUnitOfWork] Connection failed: " << e.what() << std::endl;
            throw domain::ConcurrencyException(domain::ConcurrencyException::Code::LOCK_TIMEOUT,
                                               std::string("cannot open transaction: ") + e.what());
        }
    }

private:
    std::shared_ptr<settings::DbSettings> dbSettings_;
    std::shared_ptr<settings::LedgerSettings> ledgerSettings_;

    void initSchema() {
        pqxx::connection conn(dbSettings_->getConnectionString());
        pqxx::work txn(conn);
        txn.exec(LEDGER_SCHEMA_SQL);
        txn.commit();
        std::cout << "[PostgresLedgerUnitOfWork] Schema initialized" << std::endl;
    }
};

} // namespace ledger::adapters::secondary
