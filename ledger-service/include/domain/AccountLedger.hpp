#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/SourceType.hpp"
#include "enums/JournalStatus.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Движение по счёту: строка проводки вместе с заголовком
 */
struct AccountActivity {
    int64_t entryId = 0;
    std::string entryNumber;
    Timestamp entryDate;
    SourceType sourceType = SourceType::MANUAL;
    std::string reference;
    JournalStatus status = JournalStatus::POSTED;
    int lineNumber = 0;
    std::string description;
    Money debitAmount;
    Money creditAmount;
};

struct LedgerLine {
    AccountActivity activity;
    Money runningBalance;
};

/**
 * @brief Карточка счёта за период
 */
struct AccountLedger {
    int64_t accountId = 0;
    std::string code;
    std::string name;
    Timestamp from;
    Timestamp to;
    Money openingBalance;
    Money totalDebit;
    Money totalCredit;
    Money closingBalance;
    std::vector<LedgerLine> lines;
};

} // namespace ledger::domain
