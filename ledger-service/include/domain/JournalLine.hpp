#pragma once

#include "Money.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Строка журнальной проводки
 *
 * Принадлежит проводке целиком, отдельно не создаётся и не удаляется.
 */
struct JournalLine {
    int64_t id = 0;
    int64_t journalEntryId = 0;
    int lineNumber = 0;
    int64_t accountId = 0;
    std::string description;
    Money debitAmount;
    Money creditAmount;
};

} // namespace ledger::domain
