#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Статус журнальной проводки
 *
 * DRAFT --post--> POSTED --reverse--> REVERSED (терминальный)
 */
enum class JournalStatus {
    DRAFT,
    POSTED,
    REVERSED
};

inline std::string toString(JournalStatus status) {
    switch (status) {
        case JournalStatus::DRAFT:    return "DRAFT";
        case JournalStatus::POSTED:   return "POSTED";
        case JournalStatus::REVERSED: return "REVERSED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline JournalStatus journalStatusFromString(const std::string& str) {
    if (str == "DRAFT")    return JournalStatus::DRAFT;
    if (str == "POSTED")   return JournalStatus::POSTED;
    if (str == "REVERSED") return JournalStatus::REVERSED;
    throw std::invalid_argument("Unknown JournalStatus: " + str);
}

/**
 * @brief Влияла ли проводка на остатки (была проведена)
 */
inline bool wasPosted(JournalStatus status) {
    return status == JournalStatus::POSTED || status == JournalStatus::REVERSED;
}

} // namespace ledger::domain
