#pragma once

#include "JournalEntry.hpp"
#include "Timestamp.hpp"
#include "enums/JournalStatus.hpp"
#include "enums/SourceType.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Фильтр списка проводок
 *
 * Даты включительные, reference ищется как подстрока.
 * Сортировка: дата проводки и id по убыванию.
 */
struct JournalFilter {
    std::optional<SourceType> sourceType;
    std::optional<int64_t> sourceId;
    std::optional<JournalStatus> status;
    std::optional<Timestamp> dateFrom;
    std::optional<Timestamp> dateTo;
    std::string reference;
    int page = 1;
    int limit = 20;

    int offset() const {
        return (page > 0 ? page - 1 : 0) * limit;
    }
};

struct JournalPage {
    std::vector<JournalEntry> entries;
    int64_t total = 0;
    int page = 1;
    int limit = 20;

    int64_t totalPages() const {
        return limit > 0 ? (total + limit - 1) / limit : 0;
    }
};

} // namespace ledger::domain
