#pragma once

#include "domain/AccountBalance.hpp"
#include "domain/AccountLedger.hpp"
#include "domain/JournalEntry.hpp"
#include "domain/JournalFilter.hpp"
#include "domain/Timestamp.hpp"
#include <vector>
#include <optional>
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Запросы для отчётности (только чтение)
 *
 * По умолчанию видны только проведённые проводки.
 */
class ILedgerQueryService {
public:
    virtual ~ILedgerQueryService() = default;

    /**
     * @brief Остатки всех счетов на дату (включительно); без даты - на текущий момент
     */
    virtual std::vector<domain::AccountBalance> getAccountBalances(
        const std::optional<domain::Timestamp>& asOf, bool includeDrafts = false) = 0;

    /**
     * @brief Проводки документа-источника; черновики только по явному запросу
     */
    virtual std::vector<domain::JournalEntry> getEntriesBySource(
        domain::SourceType sourceType, int64_t sourceId, bool includeDrafts = false) = 0;

    /**
     * @throws domain::IntegrityException если счёта нет
     */
    virtual domain::AccountLedger getLedgerForAccount(
        int64_t accountId,
        const std::optional<domain::Timestamp>& from,
        const std::optional<domain::Timestamp>& to,
        bool includeDrafts = false) = 0;

    virtual domain::JournalPage listEntries(const domain::JournalFilter& filter) = 0;
};

} // namespace ledger::ports::input
