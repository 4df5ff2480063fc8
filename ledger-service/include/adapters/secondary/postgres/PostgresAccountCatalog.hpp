#pragma once

#include "ports/output/IAccountCatalog.hpp"
#include "adapters/secondary/postgres/PostgresLedgerSession.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief План счетов из PostgreSQL, отдельное соединение на каждый запрос
 *
 * Кэширование - в CachedAccountCatalog.
 */
class PostgresAccountCatalog : public ports::output::IAccountCatalog {
public:
    explicit PostgresAccountCatalog(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresAccountCatalog] Created" << std::endl;
    }

    std::optional<domain::Account> findById(int64_t id) override {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        return PostgresAccountRepository(txn).findById(id);
    }

    std::optional<domain::Account> findByCode(const std::string& code) override {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        return PostgresAccountRepository(txn).findByCode(code);
    }

    std::vector<domain::Account> findAll() override {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        return PostgresAccountRepository(txn).findAll();
    }

    void invalidate(const std::vector<int64_t>&) override {}

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ledger::adapters::secondary
