#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/SourceType.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace ledger::domain {

struct JournalLineRequest {
    int64_t accountId = 0;
    std::string description;
    Money debitAmount;
    Money creditAmount;

    static JournalLineRequest debit(int64_t accountId, Money amount, const std::string& description = "") {
        return JournalLineRequest{accountId, description, amount, Money()};
    }

    static JournalLineRequest credit(int64_t accountId, Money amount, const std::string& description = "") {
        return JournalLineRequest{accountId, description, Money(), amount};
    }
};

/**
 * @brief Запрос на создание проводки
 *
 * Пара (sourceType, sourceId) - ключ идемпотентности: повторный запрос
 * по той же паре не создаёт вторую проводку.
 */
struct JournalEntryRequest {
    SourceType sourceType = SourceType::MANUAL;
    std::optional<int64_t> sourceId;
    std::string reference;
    Timestamp entryDate;
    std::string description;
    std::vector<JournalLineRequest> lines;
    bool autoPost = false;
    std::string createdBy;
};

} // namespace ledger::domain
