#pragma once

#include "ports/output/IDeadLetterSink.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief Dead-letter в таблице journal_dead_letters
 *
 * Таблицу создаёт PostgresLedgerUnitOfWork::initSchema().
 */
class PostgresDeadLetterRepository : public ports::output::IDeadLetterSink {
public:
    explicit PostgresDeadLetterRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresDeadLetterRepository] Created" << std::endl;
    }

    void put(const domain::DeadLetter& letter) override {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        txn.exec_params(
            "INSERT INTO journal_dead_letters (task_name, payload, last_error, attempts, failed_at) "
            "VALUES ($1, $2, $3, $4, TO_TIMESTAMP($5))",
            letter.taskName, letter.payload, letter.lastError, letter.attempts,
            letter.failedAt.epochSeconds());
        txn.commit();
        std::cout << "[PostgresDeadLetterRepository] Stored " << letter.taskName << std::endl;
    }

    std::vector<domain::DeadLetter> list(size_t limit) override {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            "SELECT id, task_name, payload, last_error, attempts, "
            "EXTRACT(EPOCH FROM failed_at)::BIGINT AS failed_at "
            "FROM journal_dead_letters ORDER BY id DESC LIMIT $1",
            static_cast<int64_t>(limit));

        std::vector<domain::DeadLetter> letters;
        for (const auto& row : result) {
            domain::DeadLetter letter;
            letter.id = row["id"].as<int64_t>();
            letter.taskName = row["task_name"].as<std::string>();
            letter.payload = row["payload"].as<std::string>();
            letter.lastError = row["last_error"].as<std::string>();
            letter.attempts = row["attempts"].as<int>();
            letter.failedAt = domain::Timestamp::fromEpochSeconds(row["failed_at"].as<int64_t>());
            letters.push_back(letter);
        }
        return letters;
    }

    size_t count() override {
        pqxx::connection conn(settings_->getConnectionString());
        pqxx::work txn(conn);
        auto result = txn.exec("SELECT COUNT(*) FROM journal_dead_letters");
        return static_cast<size_t>(result[0][0].as<int64_t>());
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
};

} // namespace ledger::adapters::secondary
