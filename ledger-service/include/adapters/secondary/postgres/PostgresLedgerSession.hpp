#pragma once

#include "ports/output/ILedgerUnitOfWork.hpp"
#include "adapters/secondary/postgres/PostgresErrors.hpp"
#include "domain/LedgerErrors.hpp"
#include <pqxx/pqxx>
#include <chrono>
#include <sstream>
#include <iostream>

namespace ledger::adapters::secondary {

namespace pg_detail {

using Code = domain::ConcurrencyException::Code;

inline std::optional<std::string> dateParam(const std::optional<domain::Timestamp>& ts) {
    if (!ts) return std::nullopt;
    return ts->toDateString();
}

inline std::string idArray(const std::vector<int64_t>& ids) {
    std::ostringstream ss;
    ss << "{";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) ss << ",";
        ss << ids[i];
    }
    ss << "}";
    return ss.str();
}

inline const char* visibleStatuses(bool includeDrafts) {
    return includeDrafts ? "('POSTED','REVERSED','DRAFT')" : "('POSTED','REVERSED')";
}

constexpr const char* ACCOUNT_COLUMNS =
    "id, code, name, type, parent_id, is_header, is_active, current_balance, "
    "EXTRACT(EPOCH FROM balance_updated_at)::BIGINT AS balance_updated_at";

constexpr const char* ENTRY_COLUMNS =
    "id, entry_number, source_type, source_id, reference, "
    "TO_CHAR(entry_date, 'YYYY-MM-DD') AS entry_date, description, status, "
    "total_debit, total_credit, created_by, "
    "EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at, "
    "EXTRACT(EPOCH FROM posted_at)::BIGINT AS posted_at, "
    "reversal_of_id, reversed_by_id, reversal_reason";

inline domain::Account rowToAccount(const pqxx::row& row) {
    domain::Account account;
    account.id = row["id"].as<int64_t>();
    account.code = row["code"].as<std::string>();
    account.name = row["name"].as<std::string>();
    account.type = domain::accountTypeFromString(row["type"].as<std::string>());
    if (!row["parent_id"].is_null()) {
        account.parentId = row["parent_id"].as<int64_t>();
    }
    account.isHeader = row["is_header"].as<bool>();
    account.isActive = row["is_active"].as<bool>();
    account.currentBalance = domain::Money(row["current_balance"].as<int64_t>());
    account.balanceUpdatedAt = domain::Timestamp::fromEpochSeconds(row["balance_updated_at"].as<int64_t>());
    return account;
}

inline domain::JournalEntry rowToEntry(const pqxx::row& row) {
    domain::JournalEntry entry;
    entry.id = row["id"].as<int64_t>();
    entry.entryNumber = row["entry_number"].as<std::string>();
    entry.sourceType = domain::sourceTypeFromString(row["source_type"].as<std::string>());
    if (!row["source_id"].is_null()) {
        entry.sourceId = row["source_id"].as<int64_t>();
    }
    entry.reference = row["reference"].as<std::string>();
    entry.entryDate = domain::Timestamp::fromString(row["entry_date"].as<std::string>());
    entry.description = row["description"].as<std::string>();
    entry.status = domain::journalStatusFromString(row["status"].as<std::string>());
    entry.totalDebit = domain::Money(row["total_debit"].as<int64_t>());
    entry.totalCredit = domain::Money(row["total_credit"].as<int64_t>());
    entry.createdBy = row["created_by"].as<std::string>();
    entry.createdAt = domain::Timestamp::fromEpochSeconds(row["created_at"].as<int64_t>());
    if (!row["posted_at"].is_null()) {
        entry.postedAt = domain::Timestamp::fromEpochSeconds(row["posted_at"].as<int64_t>());
    }
    if (!row["reversal_of_id"].is_null()) {
        entry.reversalOfId = row["reversal_of_id"].as<int64_t>();
    }
    if (!row["reversed_by_id"].is_null()) {
        entry.reversedById = row["reversed_by_id"].as<int64_t>();
    }
    entry.reversalReason = row["reversal_reason"].as<std::string>();
    return entry;
}

} // namespace pg_detail

/**
 * @brief Счета в транзакции PostgreSQL
 */
class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(pqxx::work& txn) : txn_(txn) {}

    std::optional<domain::Account> findById(int64_t id) override {
        return withSqlErrors(TAG, "findById", pg_detail::Code::LOCK_TIMEOUT, [&]() -> std::optional<domain::Account> {
            auto result = txn_.exec_params(
                std::string("SELECT ") + pg_detail::ACCOUNT_COLUMNS + " FROM accounts WHERE id = $1", id);
            if (result.empty()) return std::nullopt;
            return pg_detail::rowToAccount(result[0]);
        });
    }

    std::vector<domain::Account> findByIds(const std::vector<int64_t>& ids) override {
        if (ids.empty()) return {};
        return withSqlErrors(TAG, "findByIds", pg_detail::Code::LOCK_TIMEOUT, [&]() {
            auto result = txn_.exec_params(
                std::string("SELECT ") + pg_detail::ACCOUNT_COLUMNS +
                " FROM accounts WHERE id = ANY($1::BIGINT[]) ORDER BY id",
                pg_detail::idArray(ids));
            std::vector<domain::Account> accounts;
            for (const auto& row : result) {
                accounts.push_back(pg_detail::rowToAccount(row));
            }
            return accounts;
        });
    }

    std::optional<domain::Account> findByCode(const std::string& code) override {
        return withSqlErrors(TAG, "findByCode", pg_detail::Code::LOCK_TIMEOUT, [&]() -> std::optional<domain::Account> {
            auto result = txn_.exec_params(
                std::string("SELECT ") + pg_detail::ACCOUNT_COLUMNS + " FROM accounts WHERE code = $1", code);
            if (result.empty()) return std::nullopt;
            return pg_detail::rowToAccount(result[0]);
        });
    }

    std::vector<domain::Account> findAll() override {
        return withSqlErrors(TAG, "findAll", pg_detail::Code::LOCK_TIMEOUT, [&]() {
            auto result = txn_.exec(std::string("SELECT ") + pg_detail::ACCOUNT_COLUMNS +
                                    " FROM accounts ORDER BY code");
            std::vector<domain::Account> accounts;
            for (const auto& row : result) {
                accounts.push_back(pg_detail::rowToAccount(row));
            }
            return accounts;
        });
    }

    domain::Money applyBalanceDelta(int64_t id, domain::Money delta) override {
        return withSqlErrors(TAG, "applyBalanceDelta", pg_detail::Code::BALANCE_CONTENTION, [&]() {
            // Атомарное изменение под блокировкой строки, без read-modify-write
            auto result = txn_.exec_params(
                "UPDATE accounts SET current_balance = current_balance + $2, balance_updated_at = NOW() "
                "WHERE id = $1 RETURNING current_balance",
                id, delta.minor);
            if (result.empty()) {
                throw domain::IntegrityException("Account not found: " + std::to_string(id));
            }
            return domain::Money(result[0]["current_balance"].as<int64_t>());
        });
    }

    void setBalance(int64_t id, domain::Money balance) override {
        withSqlErrors(TAG, "setBalance", pg_detail::Code::BALANCE_CONTENTION, [&]() {
            auto result = txn_.exec_params(
                "UPDATE accounts SET current_balance = $2, balance_updated_at = NOW() WHERE id = $1",
                id, balance.minor);
            if (result.affected_rows() == 0) {
                throw domain::IntegrityException("Account not found: " + std::to_string(id));
            }
        });
    }

private:
    static constexpr const char* TAG = "PostgresAccountRepository";
    pqxx::work& txn_;
};

/**
 * @brief Проводки в транзакции PostgreSQL
 */
class PostgresJournalEntryRepository : public ports::output::IJournalEntryRepository {
public:
    explicit PostgresJournalEntryRepository(pqxx::work& txn) : txn_(txn) {}

    domain::JournalEntry insert(const domain::JournalEntry& entry) override {
        return withSqlErrors(TAG, "insert", pg_detail::Code::LOCK_TIMEOUT, [&]() {
            domain::JournalEntry saved = entry;

            auto result = txn_.exec_params(
                "INSERT INTO journal_entries (entry_number, source_type, source_id, reference, entry_date, "
                "description, status, total_debit, total_credit, created_by, created_at, "
                "reversal_of_id, reversal_reason) "
                "VALUES ($1, $2, $3, $4, $5::DATE, $6, $7, $8, $9, $10, TO_TIMESTAMP($11), $12, $13) "
                "RETURNING id",
                entry.entryNumber,
                domain::toString(entry.sourceType),
                entry.sourceId,
                entry.reference,
                entry.entryDate.toDateString(),
                entry.description,
                domain::toString(entry.status),
                entry.totalDebit.minor,
                entry.totalCredit.minor,
                entry.createdBy,
                entry.createdAt.epochSeconds(),
                entry.reversalOfId,
                entry.reversalReason);
            saved.id = result[0]["id"].as<int64_t>();

            for (auto& line : saved.lines) {
                auto lineResult = txn_.exec_params(
                    "INSERT INTO journal_lines (journal_entry_id, line_number, account_id, description, "
                    "debit_amount, credit_amount) VALUES ($1, $2, $3, $4, $5, $6) RETURNING id",
                    saved.id, line.lineNumber, line.accountId, line.description,
                    line.debitAmount.minor, line.creditAmount.minor);
                line.id = lineResult[0]["id"].as<int64_t>();
                line.journalEntryId = saved.id;
            }
            return saved;
        });
    }

    std::optional<domain::JournalEntry> findById(int64_t id, bool forUpdate) override {
        return withSqlErrors(TAG, "findById", pg_detail::Code::LOCK_TIMEOUT, [&]() -> std::optional<domain::JournalEntry> {
            auto result = txn_.exec_params(
                std::string("SELECT ") + pg_detail::ENTRY_COLUMNS +
                " FROM journal_entries WHERE id = $1" + (forUpdate ? " FOR UPDATE" : ""),
                id);
            if (result.empty()) return std::nullopt;
            auto entry = pg_detail::rowToEntry(result[0]);
            loadLines(entry);
            return entry;
        });
    }

    void markPosted(int64_t id, const domain::Timestamp& postedAt) override {
        withSqlErrors(TAG, "markPosted", pg_detail::Code::LOCK_TIMEOUT, [&]() {
            auto result = txn_.exec_params(
                "UPDATE journal_entries SET status = 'POSTED', posted_at = TO_TIMESTAMP($2) "
                "WHERE id = $1 AND status = 'DRAFT'",
                id, postedAt.epochSeconds());
            if (result.affected_rows() == 0) {
                throw domain::StateException(domain::StateException::Code::ALREADY_POSTED,
                                             "Entry " + std::to_string(id) + " is not a draft");
            }
        });
    }

    void markReversed(int64_t id, int64_t reversedById, const std::string& reason) override {
        withSqlErrors(TAG, "markReversed", pg_detail::Code::LOCK_TIMEOUT, [&]() {
            auto result = txn_.exec_params(
                "UPDATE journal_entries SET status = 'REVERSED', reversed_by_id = $2, reversal_reason = $3 "
                "WHERE id = $1 AND status = 'POSTED'",
                id, reversedById, reason);
            if (result.affected_rows() == 0) {
                throw domain::StateException(domain::StateException::Code::NOT_POSTED,
                                             "Entry " + std::to_string(id) + " is not posted");
            }
        });
    }

    void lockSource(domain::SourceType sourceType, int64_t sourceId) override {
        withSqlErrors(TAG, "lockSource", pg_detail::Code::LOCK_TIMEOUT, [&]() {
            txn_.exec_params(
                "SELECT pg_advisory_xact_lock(hashtextextended($1 || ':' || $2::TEXT, 0))",
                domain::toString(sourceType), sourceId);
        });
    }

    std::optional<domain::JournalEntry> findActiveBySource(domain::SourceType sourceType,
                                                           int64_t sourceId) override {
        return withSqlErrors(TAG, "findActiveBySource", pg_detail::Code::LOCK_TIMEOUT,
                             [&]() -> std::optional<domain::JournalEntry> {
            auto result = txn_.exec_params(
                std::string("SELECT ") + pg_detail::ENTRY_COLUMNS +
                " FROM journal_entries WHERE source_type = $1 AND source_id = $2 AND status <> 'REVERSED' "
                "ORDER BY id LIMIT 1",
                domain::toString(sourceType), sourceId);
            if (result.empty()) return std::nullopt;
            auto entry = pg_detail::rowToEntry(result[0]);
            loadLines(entry);
            return entry;
        });
    }

    std::vector<domain::JournalEntry> findBySource(domain::SourceType sourceType, int64_t sourceId,
                                                   bool includeDrafts) override {
        return withSqlErrors(TAG, "findBySource", pg_detail::Code::LOCK_TIMEOUT, [&]() {
            auto result = txn_.exec_params(
                std::string("SELECT ") + pg_detail::ENTRY_COLUMNS +
                " FROM journal_entries WHERE source_type = $1 AND source_id = $2 AND status IN " +
                pg_detail::visibleStatuses(includeDrafts) + " ORDER BY id",
                domain::toString(sourceType), sourceId);
            return rowsToEntries(result);
        });
    }

    domain::JournalPage list(const domain::JournalFilter& filter) override {
        return withSqlErrors(TAG, "list", pg_detail::Code::LOCK_TIMEOUT, [&]() {
            std::string where = " WHERE TRUE";
            if (filter.sourceType) {
                where += " AND source_type = " + txn_.quote(domain::toString(*filter.sourceType));
            }
            if (filter.sourceId) {
                where += " AND source_id = " + std::to_string(*filter.sourceId);
            }
            if (filter.status) {
                where += " AND status = " + txn_.quote(domain::toString(*filter.status));
            }
            if (filter.dateFrom) {
                where += " AND entry_date >= " + txn_.quote(filter.dateFrom->toDateString()) + "::DATE";
            }
            if (filter.dateTo) {
                where += " AND entry_date <= " + txn_.quote(filter.dateTo->toDateString()) + "::DATE";
            }
            if (!filter.reference.empty()) {
                where += " AND reference ILIKE " + txn_.quote("%" + txn_.esc_like(filter.reference) + "%");
            }

            domain::JournalPage page;
            page.page = filter.page;
            page.limit = filter.limit;

            auto count = txn_.exec("SELECT COUNT(*) AS total FROM journal_entries" + where);
            page.total = count[0]["total"].as<int64_t>();

            auto result = txn_.exec(
                std::string("SELECT ") + pg_detail::ENTRY_COLUMNS + " FROM journal_entries" + where +
                " ORDER BY entry_date DESC, id DESC LIMIT " + std::to_string(filter.limit) +
                " OFFSET " + std::to_string(filter.offset()));
            page.entries = rowsToEntries(result);
            return page;
        });
    }

    domain::LineTotals sumLines(int64_t accountId,
                                const std::optional<domain::Timestamp>& before,
                                bool includeDrafts) override {
        return withSqlErrors(TAG, "sumLines", pg_detail::Code::LOCK_TIMEOUT, [&]() {
            auto result = txn_.exec_params(
                std::string("SELECT COALESCE(SUM(l.debit_amount), 0)::BIGINT AS debit, "
                            "COALESCE(SUM(l.credit_amount), 0)::BIGINT AS credit "
                            "FROM journal_lines l JOIN journal_entries e ON e.id = l.journal_entry_id "
                            "WHERE l.account_id = $1 AND e.status IN ") +
                    pg_detail::visibleStatuses(includeDrafts) +
                    " AND ($2::DATE IS NULL OR e.entry_date < $2::DATE)",
                accountId, pg_detail::dateParam(before));

            domain::LineTotals totals;
            totals.debit = domain::Money(result[0]["debit"].as<int64_t>());
            totals.credit = domain::Money(result[0]["credit"].as<int64_t>());
            return totals;
        });
    }

    std::map<int64_t, domain::LineTotals> totalsByAccount(const std::optional<domain::Timestamp>& asOf,
                                                          bool includeDrafts) override {
        return withSqlErrors(TAG, "totalsByAccount", pg_detail::Code::LOCK_TIMEOUT, [&]() {
            auto result = txn_.exec_params(
                std::string("SELECT l.account_id, SUM(l.debit_amount)::BIGINT AS debit, "
                            "SUM(l.credit_amount)::BIGINT AS credit "
                            "FROM journal_lines l JOIN journal_entries e ON e.id = l.journal_entry_id "
                            "WHERE e.status IN ") +
                    pg_detail::visibleStatuses(includeDrafts) +
                    " AND ($1::DATE IS NULL OR e.entry_date <= $1::DATE) GROUP BY l.account_id",
                pg_detail::dateParam(asOf));

            std::map<int64_t, domain::LineTotals> totals;
            for (const auto& row : result) {
                auto& t = totals[row["account_id"].as<int64_t>()];
                t.debit = domain::Money(row["debit"].as<int64_t>());
                t.credit = domain::Money(row["credit"].as<int64_t>());
            }
            return totals;
        });
    }

    std::vector<domain::AccountActivity> findAccountActivity(int64_t accountId,
                                                             const std::optional<domain::Timestamp>& from,
                                                             const std::optional<domain::Timestamp>& to,
                                                             bool includeDrafts) override {
        return withSqlErrors(TAG, "findAccountActivity", pg_detail::Code::LOCK_TIMEOUT, [&]() {
            auto result = txn_.exec_params(
                std::string("SELECT e.id AS entry_id, e.entry_number, TO_CHAR(e.entry_date, 'YYYY-MM-DD') AS entry_date, "
                            "e.source_type, e.reference, e.status, l.line_number, l.description, "
                            "l.debit_amount, l.credit_amount "
                            "FROM journal_lines l JOIN journal_entries e ON e.id = l.journal_entry_id "
                            "WHERE l.account_id = $1 AND e.status IN ") +
                    pg_detail::visibleStatuses(includeDrafts) +
                    " AND ($2::DATE IS NULL OR e.entry_date >= $2::DATE)"
                    " AND ($3::DATE IS NULL OR e.entry_date <= $3::DATE)"
                    " ORDER BY e.entry_date, e.id, l.line_number",
                accountId, pg_detail::dateParam(from), pg_detail::dateParam(to));

            std::vector<domain::AccountActivity> activity;
            for (const auto& row : result) {
                domain::AccountActivity item;
                item.entryId = row["entry_id"].as<int64_t>();
                item.entryNumber = row["entry_number"].as<std::string>();
                item.entryDate = domain::Timestamp::fromString(row["entry_date"].as<std::string>());
                item.sourceType = domain::sourceTypeFromString(row["source_type"].as<std::string>());
                item.reference = row["reference"].as<std::string>();
                item.status = domain::journalStatusFromString(row["status"].as<std::string>());
                item.lineNumber = row["line_number"].as<int>();
                item.description = row["description"].as<std::string>();
                item.debitAmount = domain::Money(row["debit_amount"].as<int64_t>());
                item.creditAmount = domain::Money(row["credit_amount"].as<int64_t>());
                activity.push_back(item);
            }
            return activity;
        });
    }

private:
    static constexpr const char* TAG = "PostgresJournalEntryRepository";
    pqxx::work& txn_;

    void loadLines(domain::JournalEntry& entry) {
        auto result = txn_.exec_params(
            "SELECT id, journal_entry_id, line_number, account_id, description, debit_amount, credit_amount "
            "FROM journal_lines WHERE journal_entry_id = $1 ORDER BY line_number",
            entry.id);
        for (const auto& row : result) {
            domain::JournalLine line;
            line.id = row["id"].as<int64_t>();
            line.journalEntryId = row["journal_entry_id"].as<int64_t>();
            line.lineNumber = row["line_number"].as<int>();
            line.accountId = row["account_id"].as<int64_t>();
            line.description = row["description"].as<std::string>();
            line.debitAmount = domain::Money(row["debit_amount"].as<int64_t>());
            line.creditAmount = domain::Money(row["credit_amount"].as<int64_t>());
            entry.lines.push_back(line);
        }
    }

    std::vector<domain::JournalEntry> rowsToEntries(const pqxx::result& result) {
        std::vector<domain::JournalEntry> entries;
        for (const auto& row : result) {
            entries.push_back(pg_detail::rowToEntry(row));
        }
        for (auto& entry : entries) {
            loadLines(entry);
        }
        return entries;
    }
};

/**
 * @brief Счётчики номеров в транзакции PostgreSQL
 */
class PostgresSequenceRepository : public ports::output::ISequenceRepository {
public:
    explicit PostgresSequenceRepository(pqxx::work& txn) : txn_(txn) {}

    int64_t nextValue(const std::string& prefix) override {
        return withSqlErrors("PostgresSequenceRepository", "nextValue",
                             pg_detail::Code::SEQUENCE_CONTENTION, [&]() {
            txn_.exec_params(
                "INSERT INTO journal_sequences (prefix, last_value) VALUES ($1, 0) "
                "ON CONFLICT (prefix) DO NOTHING",
                prefix);

            // UPDATE берёт блокировку строки до конца транзакции
            auto result = txn_.exec_params(
                "UPDATE journal_sequences SET last_value = last_value + 1, updated_at = NOW() "
                "WHERE prefix = $1 RETURNING last_value",
                prefix);
            return result[0]["last_value"].as<int64_t>();
        });
    }

private:
    pqxx::work& txn_;
};

/**
 * @brief Транзакция PostgreSQL: своё соединение и pqxx::work
 *
 * Без commit() транзакция откатывается в деструкторе pqxx::work.
 */
class PostgresLedgerSession : public ports::output::ILedgerSession {
public:
    PostgresLedgerSession(const std::string& connectionString, std::chrono::milliseconds lockTimeout)
        : connection_(connectionString)
        , txn_(connection_)
        , accounts_(txn_)
        , entries_(txn_)
        , sequences_(txn_)
    {
        txn_.exec("SET LOCAL lock_timeout = '" + std::to_string(lockTimeout.count()) + "ms'");
    }

    ports::output::IAccountRepository& accounts() override { return accounts_; }
    ports::output::IJournalEntryRepository& entries() override { return entries_; }
    ports::output::ISequenceRepository& sequences() override { return sequences_; }

    void commit() override {
        withSqlErrors("PostgresLedgerSession", "commit", pg_detail::Code::BALANCE_CONTENTION, [&]() {
            txn_.commit();
        });
        finished_ = true;
    }

    void rollback() override {
        if (!finished_) {
            txn_.abort();
            finished_ = true;
        }
    }

private:
    pqxx::connection connection_;
    pqxx::work txn_;
    PostgresAccountRepository accounts_;
    PostgresJournalEntryRepository entries_;
    PostgresSequenceRepository sequences_;
    bool finished_ = false;
};

} // namespace ledger::adapters::secondary
