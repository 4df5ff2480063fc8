#pragma once

#include "ports/output/ILedgerUnitOfWork.hpp"
#include "ports/output/IAccountCatalog.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/LedgerErrors.hpp"
#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief Состояние хранилища в памяти
 */
struct InMemoryLedgerState {
    std::map<int64_t, domain::Account> accounts;
    std::map<int64_t, domain::JournalEntry> entries;
    std::map<std::string, int64_t> sequences;
    int64_t nextEntryId = 1;
    int64_t nextLineId = 1;
};

namespace memory_detail {

inline bool visible(domain::JournalStatus status, bool includeDrafts) {
    return domain::wasPosted(status) || (includeDrafts && status == domain::JournalStatus::DRAFT);
}

class AccountRepository : public ports::output::IAccountRepository {
public:
    explicit AccountRepository(InMemoryLedgerState& state) : state_(state) {}

    std::optional<domain::Account> findById(int64_t id) override {
        auto it = state_.accounts.find(id);
        if (it == state_.accounts.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::Account> findByIds(const std::vector<int64_t>& ids) override {
        std::vector<domain::Account> result;
        for (auto id : ids) {
            auto it = state_.accounts.find(id);
            if (it != state_.accounts.end()) {
                result.push_back(it->second);
            }
        }
        return result;
    }

    std::optional<domain::Account> findByCode(const std::string& code) override {
        for (const auto& [id, account] : state_.accounts) {
            if (account.code == code) return account;
        }
        return std::nullopt;
    }

    std::vector<domain::Account> findAll() override {
        std::vector<domain::Account> result;
        for (const auto& [id, account] : state_.accounts) {
            result.push_back(account);
        }
        std::sort(result.begin(), result.end(),
                  [](const domain::Account& a, const domain::Account& b) { return a.code < b.code; });
        return result;
    }

    domain::Money applyBalanceDelta(int64_t id, domain::Money delta) override {
        auto it = state_.accounts.find(id);
        if (it == state_.accounts.end()) {
            throw domain::IntegrityException("Account not found: " + std::to_string(id));
        }
        it->second.currentBalance += delta;
        it->second.balanceUpdatedAt = domain::Timestamp::now();
        return it->second.currentBalance;
    }

    void setBalance(int64_t id, domain::Money balance) override {
        auto it = state_.accounts.find(id);
        if (it == state_.accounts.end()) {
            throw domain::IntegrityException("Account not found: " + std::to_string(id));
        }
        it->second.currentBalance = balance;
        it->second.balanceUpdatedAt = domain::Timestamp::now();
    }

private:
    InMemoryLedgerState& state_;
};

class JournalEntryRepository : public ports::output::IJournalEntryRepository {
public:
    explicit JournalEntryRepository(InMemoryLedgerState& state) : state_(state) {}

    domain::JournalEntry insert(const domain::JournalEntry& entry) override {
        if (entry.sourceId && findActiveBySource(entry.sourceType, *entry.sourceId)) {
            throw domain::ConcurrencyException(domain::ConcurrencyException::Code::DUPLICATE_SOURCE,
                                               "Active entry already exists for " +
                                               domain::toString(entry.sourceType) + "#" +
                                               std::to_string(*entry.sourceId));
        }

        domain::JournalEntry saved = entry;
        saved.id = state_.nextEntryId++;
        for (auto& line : saved.lines) {
            line.id = state_.nextLineId++;
            line.journalEntryId = saved.id;
        }
        state_.entries[saved.id] = saved;
        return saved;
    }

    std::optional<domain::JournalEntry> findById(int64_t id, bool) override {
        auto it = state_.entries.find(id);
        if (it == state_.entries.end()) return std::nullopt;
        return it->second;
    }

    void markPosted(int64_t id, const domain::Timestamp& postedAt) override {
        auto& entry = require(id);
        entry.status = domain::JournalStatus::POSTED;
        entry.postedAt = postedAt;
    }

    void markReversed(int64_t id, int64_t reversedById, const std::string& reason) override {
        auto& entry = require(id);
        entry.status = domain::JournalStatus::REVERSED;
        entry.reversedById = reversedById;
        entry.reversalReason = reason;
    }

    // Сессия уже держит глобальную блокировку хранилища
    void lockSource(domain::SourceType, int64_t) override {}

    std::optional<domain::JournalEntry> findActiveBySource(domain::SourceType sourceType,
                                                           int64_t sourceId) override {
        for (const auto& [id, entry] : state_.entries) {
            if (entry.sourceType == sourceType && entry.sourceId && *entry.sourceId == sourceId &&
                entry.status != domain::JournalStatus::REVERSED) {
                return entry;
            }
        }
        return std::nullopt;
    }

    std::vector<domain::JournalEntry> findBySource(domain::SourceType sourceType, int64_t sourceId,
                                                   bool includeDrafts) override {
        std::vector<domain::JournalEntry> result;
        for (const auto& [id, entry] : state_.entries) {
            if (!visible(entry.status, includeDrafts)) continue;
            if (entry.sourceType == sourceType && entry.sourceId && *entry.sourceId == sourceId) {
                result.push_back(entry);
            }
        }
        return result;
    }

    domain::JournalPage list(const domain::JournalFilter& filter) override {
        std::vector<const domain::JournalEntry*> matched;
        for (const auto& [id, entry] : state_.entries) {
            if (filter.sourceType && entry.sourceType != *filter.sourceType) continue;
            if (filter.sourceId && (!entry.sourceId || *entry.sourceId != *filter.sourceId)) continue;
            if (filter.status && entry.status != *filter.status) continue;
            if (filter.dateFrom && entry.entryDate < filter.dateFrom->startOfDay()) continue;
            if (filter.dateTo && entry.entryDate > *filter.dateTo) continue;
            if (!filter.reference.empty() && entry.reference.find(filter.reference) == std::string::npos) continue;
            matched.push_back(&entry);
        }

        std::sort(matched.begin(), matched.end(), [](const domain::JournalEntry* a, const domain::JournalEntry* b) {
            if (a->entryDate != b->entryDate) return a->entryDate > b->entryDate;
            return a->id > b->id;
        });

        domain::JournalPage page;
        page.total = static_cast<int64_t>(matched.size());
        page.page = filter.page;
        page.limit = filter.limit;
        for (size_t i = static_cast<size_t>(filter.offset());
             i < matched.size() && page.entries.size() < static_cast<size_t>(filter.limit); ++i) {
            page.entries.push_back(*matched[i]);
        }
        return page;
    }

    domain::LineTotals sumLines(int64_t accountId,
                                const std::optional<domain::Timestamp>& before,
                                bool includeDrafts) override {
        domain::LineTotals totals;
        for (const auto& [id, entry] : state_.entries) {
            if (!visible(entry.status, includeDrafts)) continue;
            if (before && !(entry.entryDate < *before)) continue;
            for (const auto& line : entry.lines) {
                if (line.accountId == accountId) {
                    totals.debit += line.debitAmount;
                    totals.credit += line.creditAmount;
                }
            }
        }
        return totals;
    }

    std::map<int64_t, domain::LineTotals> totalsByAccount(const std::optional<domain::Timestamp>& asOf,
                                                          bool includeDrafts) override {
        std::map<int64_t, domain::LineTotals> result;
        for (const auto& [id, entry] : state_.entries) {
            if (!visible(entry.status, includeDrafts)) continue;
            if (asOf && entry.entryDate > *asOf) continue;
            for (const auto& line : entry.lines) {
                auto& totals = result[line.accountId];
                totals.debit += line.debitAmount;
                totals.credit += line.creditAmount;
            }
        }
        return result;
    }

    std::vector<domain::AccountActivity> findAccountActivity(int64_t accountId,
                                                             const std::optional<domain::Timestamp>& from,
                                                             const std::optional<domain::Timestamp>& to,
                                                             bool includeDrafts) override {
        std::vector<domain::AccountActivity> result;
        for (const auto& [id, entry] : state_.entries) {
            if (!visible(entry.status, includeDrafts)) continue;
            if (from && entry.entryDate < *from) continue;
            if (to && entry.entryDate > *to) continue;
            for (const auto& line : entry.lines) {
                if (line.accountId != accountId) continue;
                domain::AccountActivity activity;
                activity.entryId = entry.id;
                activity.entryNumber = entry.entryNumber;
                activity.entryDate = entry.entryDate;
                activity.sourceType = entry.sourceType;
                activity.reference = entry.reference;
                activity.status = entry.status;
                activity.lineNumber = line.lineNumber;
                activity.description = line.description;
                activity.debitAmount = line.debitAmount;
                activity.creditAmount = line.creditAmount;
                result.push_back(activity);
            }
        }

        std::stable_sort(result.begin(), result.end(),
                         [](const domain::AccountActivity& a, const domain::AccountActivity& b) {
                             if (a.entryDate != b.entryDate) return a.entryDate < b.entryDate;
                             if (a.entryId != b.entryId) return a.entryId < b.entryId;
                             return a.lineNumber < b.lineNumber;
                         });
        return result;
    }

private:
    InMemoryLedgerState& state_;

    domain::JournalEntry& require(int64_t id) {
        auto it = state_.entries.find(id);
        if (it == state_.entries.end()) {
            throw domain::EntryNotFoundException(id);
        }
        return it->second;
    }
};

class SequenceRepository : public ports::output::ISequenceRepository {
public:
    explicit SequenceRepository(InMemoryLedgerState& state) : state_(state) {}

    int64_t nextValue(const std::string& prefix) override {
        return ++state_.sequences[prefix];
    }

private:
    InMemoryLedgerState& state_;
};

/**
 * @brief Транзакция: копия состояния под эксклюзивной блокировкой
 *
 * commit() подменяет состояние хранилища копией, rollback() её выбрасывает.
 */
class Session : public ports::output::ILedgerSession {
public:
    Session(std::unique_lock<std::timed_mutex> lock, InMemoryLedgerState& target)
        : lock_(std::move(lock))
        , target_(target)
        , staged_(target)
        , accounts_(staged_)
        , entries_(staged_)
        , sequences_(staged_)
    {}

    ports::output::IAccountRepository& accounts() override { return accounts_; }
    ports::output::IJournalEntryRepository& entries() override { return entries_; }
    ports::output::ISequenceRepository& sequences() override { return sequences_; }

    void commit() override {
        if (!lock_.owns_lock()) {
            throw std::logic_error("Session already finished");
        }
        target_ = std::move(staged_);
        lock_.unlock();
    }

    void rollback() override {
        if (lock_.owns_lock()) {
            lock_.unlock();
        }
    }

private:
    std::unique_lock<std::timed_mutex> lock_;
    InMemoryLedgerState& target_;
    InMemoryLedgerState staged_;
    AccountRepository accounts_;
    JournalEntryRepository entries_;
    SequenceRepository sequences_;
};

} // namespace memory_detail

/**
 * @brief Хранилище журнала в памяти (тесты, локальный запуск)
 *
 * Транзакции строго последовательны: begin() берёт эксклюзивную
 * блокировку с таймаутом из LedgerSettings. Хранилище должно жить
 * дольше выданных сессий.
 */
class InMemoryLedgerStore : public ports::output::ILedgerUnitOfWork,
                            public ports::output::IAccountCatalog {
public:
    explicit InMemoryLedgerStore(std::shared_ptr<settings::LedgerSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[InMemoryLedgerStore] Created" << std::endl;
    }

    std::unique_ptr<ports::output::ILedgerSession> begin() override {
        std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
        if (!lock.try_lock_for(settings_->getLockTimeout())) {
            throw domain::ConcurrencyException(domain::ConcurrencyException::Code::LOCK_TIMEOUT,
                                               "In-memory ledger is busy");
        }
        return std::make_unique<memory_detail::Session>(std::move(lock), state_);
    }

    // ============================================
    // IAccountCatalog
    // ============================================

    std::optional<domain::Account> findById(int64_t id) override {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        return memory_detail::AccountRepository(state_).findById(id);
    }

    std::optional<domain::Account> findByCode(const std::string& code) override {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        return memory_detail::AccountRepository(state_).findByCode(code);
    }

    std::vector<domain::Account> findAll() override {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        return memory_detail::AccountRepository(state_).findAll();
    }

    void invalidate(const std::vector<int64_t>&) override {}

    // ============================================
    // УПРАВЛЕНИЕ ПЛАНОМ СЧЕТОВ
    // ============================================

    /**
     * @brief Добавить или заменить счёт (план счетов ведётся вне журнала)
     */
    void upsertAccount(const domain::Account& account) {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        state_.accounts[account.id] = account;
    }

    void setAccountActive(int64_t id, bool active) {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        auto it = state_.accounts.find(id);
        if (it != state_.accounts.end()) {
            it->second.isActive = active;
        }
    }

    /**
     * @brief Испортить материализованный остаток (для проверки самовосстановления)
     */
    void corruptBalance(int64_t id, domain::Money balance) {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        auto it = state_.accounts.find(id);
        if (it != state_.accounts.end()) {
            it->second.currentBalance = balance;
        }
    }

    /**
     * @brief Базовый план счетов
     */
    void seedDefaultChart() {
        const struct { int64_t id; const char* code; const char* name; domain::AccountType type; } chart[] = {
            {1,  "1101", "Cash",                              domain::AccountType::ASSET},
            {2,  "1102", "Bank",                              domain::AccountType::ASSET},
            {3,  "1201", "Accounts receivable",               domain::AccountType::ASSET},
            {4,  "1240", "Input VAT",                         domain::AccountType::ASSET},
            {5,  "1250", "Prepaid income tax",                domain::AccountType::ASSET},
            {6,  "1301", "Inventory",                         domain::AccountType::ASSET},
            {7,  "2101", "Accounts payable",                  domain::AccountType::LIABILITY},
            {8,  "2103", "Output VAT",                        domain::AccountType::LIABILITY},
            {9,  "2111", "Withholding tax art.21 payable",    domain::AccountType::LIABILITY},
            {10, "2112", "Withholding tax art.23 payable",    domain::AccountType::LIABILITY},
            {11, "3101", "Share capital",                     domain::AccountType::EQUITY},
            {12, "4101", "Sales revenue",                     domain::AccountType::REVENUE},
            {13, "5101", "Cost of goods sold",                domain::AccountType::EXPENSE},
            {14, "6101", "Operating expenses",                domain::AccountType::EXPENSE},
        };
        for (const auto& row : chart) {
            upsertAccount(domain::Account(row.id, row.code, row.name, row.type));
        }
    }

private:
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::timed_mutex mutex_;
    InMemoryLedgerState state_;
};

} // namespace ledger::adapters::secondary
