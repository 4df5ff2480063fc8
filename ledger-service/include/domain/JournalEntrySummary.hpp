#pragma once

#include "JournalEntry.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Результат создания / сторнирования проводки
 */
struct JournalEntrySummary {
    int64_t id = 0;
    std::string entryNumber;
    JournalStatus status = JournalStatus::DRAFT;
    Money totalDebit;
    Money totalCredit;
    bool isBalanced = false;
    bool duplicate = false;  ///< проводка уже существовала для (sourceType, sourceId)
    std::optional<int64_t> reversalOfId;

    static JournalEntrySummary of(const JournalEntry& entry, bool duplicate = false, Money tolerance = Money()) {
        JournalEntrySummary s;
        s.id = entry.id;
        s.entryNumber = entry.entryNumber;
        s.status = entry.status;
        s.totalDebit = entry.totalDebit;
        s.totalCredit = entry.totalCredit;
        s.isBalanced = entry.isBalanced(tolerance);
        s.duplicate = duplicate;
        s.reversalOfId = entry.reversalOfId;
        return s;
    }
};

} // namespace ledger::domain
