#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/JournalFilter.hpp"
#include "domain/AccountBalance.hpp"
#include "domain/AccountLedger.hpp"
#include "domain/Timestamp.hpp"
#include <vector>
#include <map>
#include <optional>
#include <string>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Хранилище проводок внутри транзакции (ILedgerSession)
 *
 * Проводки и строки никогда не удаляются. Строки записываются
 * вместе с заголовком и больше не меняются.
 *
 * "Проведённые" строки - строки проводок в статусах POSTED и REVERSED:
 * сторнированный оригинал и его сторно вместе дают ноль.
 */
class IJournalEntryRepository {
public:
    virtual ~IJournalEntryRepository() = default;

    /**
     * @brief Записать заголовок и строки
     * @return проводка с присвоенными id (entry.id, line.id, line.journalEntryId)
     * @throws domain::ConcurrencyException(DUPLICATE_SOURCE) если для источника уже есть активная проводка
     */
    virtual domain::JournalEntry insert(const domain::JournalEntry& entry) = 0;

    /**
     * @param forUpdate заблокировать заголовок до конца транзакции
     */
    virtual std::optional<domain::JournalEntry> findById(int64_t id, bool forUpdate = false) = 0;

    virtual void markPosted(int64_t id, const domain::Timestamp& postedAt) = 0;

    virtual void markReversed(int64_t id, int64_t reversedById, const std::string& reason) = 0;

    /**
     * @brief Сериализовать проверку идемпотентности по (sourceType, sourceId)
     *
     * Блокировка держится до конца транзакции.
     */
    virtual void lockSource(domain::SourceType sourceType, int64_t sourceId) = 0;

    /**
     * @brief Проводка источника, которая не была сторнирована
     */
    virtual std::optional<domain::JournalEntry> findActiveBySource(
        domain::SourceType sourceType, int64_t sourceId) = 0;

    /**
     * @brief Проводки источника, включая сторнированные, по возрастанию id
     * @param includeDrafts добавить черновики
     */
    virtual std::vector<domain::JournalEntry> findBySource(
        domain::SourceType sourceType, int64_t sourceId, bool includeDrafts) = 0;

    virtual domain::JournalPage list(const domain::JournalFilter& filter) = 0;

    /**
     * @brief Обороты по счёту
     * @param before только проводки с entryDate строго раньше (если задано)
     * @param includeDrafts добавить черновики
     */
    virtual domain::LineTotals sumLines(int64_t accountId,
                                        const std::optional<domain::Timestamp>& before,
                                        bool includeDrafts) = 0;

    /**
     * @brief Обороты по всем счетам на дату (entryDate <= asOf)
     */
    virtual std::map<int64_t, domain::LineTotals> totalsByAccount(
        const std::optional<domain::Timestamp>& asOf, bool includeDrafts) = 0;

    /**
     * @brief Движения по счёту за период [from, to], по дате, id и номеру строки
     */
    virtual std::vector<domain::AccountActivity> findAccountActivity(
        int64_t accountId,
        const std::optional<domain::Timestamp>& from,
        const std::optional<domain::Timestamp>& to,
        bool includeDrafts) = 0;
};

} // namespace ledger::ports::output
