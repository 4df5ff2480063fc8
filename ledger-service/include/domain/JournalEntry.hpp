#pragma once

#include "JournalLine.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/JournalStatus.hpp"
#include "enums/SourceType.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Журнальная проводка (заголовок + строки)
 *
 * Проведённая проводка неизменяема: единственный способ её отменить -
 * сторно (новая проводка с переставленными дебетом и кредитом).
 */
class JournalEntry {
public:
    int64_t id = 0;
    std::string entryNumber;
    SourceType sourceType = SourceType::MANUAL;
    std::optional<int64_t> sourceId;
    std::string reference;
    Timestamp entryDate;
    std::string description;
    JournalStatus status = JournalStatus::DRAFT;
    Money totalDebit;
    Money totalCredit;
    std::string createdBy;
    Timestamp createdAt;
    std::optional<Timestamp> postedAt;
    std::optional<int64_t> reversalOfId;
    std::optional<int64_t> reversedById;
    std::string reversalReason;
    std::vector<JournalLine> lines;

    bool isBalanced(Money tolerance = Money()) const {
        return (totalDebit - totalCredit).abs() <= tolerance;
    }

    void recalculateTotals() {
        totalDebit = Money();
        totalCredit = Money();
        for (const auto& line : lines) {
            totalDebit += line.debitAmount;
            totalCredit += line.creditAmount;
        }
    }
};

} // namespace ledger::domain
