#pragma once

#include "domain/JournalEntry.hpp"
#include "domain/JournalEntryRequest.hpp"
#include "domain/JournalEntrySummary.hpp"
#include <optional>
#include <string>
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Создание, проведение и сторнирование проводок
 *
 * Каждая операция - одна транзакция: любая ошибка откатывает всё.
 */
class IJournalService {
public:
    virtual ~IJournalService() = default;

    /**
     * @brief Создать проводку (и провести её при autoPost)
     *
     * Если для (sourceType, sourceId) уже есть несторнированная проводка,
     * новая не создаётся: возвращается существующая с duplicate = true.
     *
     * @throws domain::ValidationException
     * @throws domain::ConcurrencyException после исчерпания повторов
     */
    virtual domain::JournalEntrySummary createEntry(const domain::JournalEntryRequest& request) = 0;

    /**
     * @brief DRAFT -> POSTED с повторной проверкой баланса
     * @throws domain::StateException(ALREADY_POSTED / ALREADY_REVERSED)
     * @throws domain::EntryNotFoundException
     */
    virtual domain::JournalEntrySummary postEntry(int64_t entryId, const std::string& actor) = 0;

    /**
     * @brief POSTED -> REVERSED, создаёт и проводит сторно
     * @throws domain::StateException(NOT_POSTED / ALREADY_REVERSED)
     * @throws domain::EntryNotFoundException
     */
    virtual domain::JournalEntrySummary reverseEntry(int64_t entryId,
                                                     const std::string& reason,
                                                     const std::string& actor) = 0;

    virtual std::optional<domain::JournalEntry> getEntry(int64_t entryId) = 0;
};

} // namespace ledger::ports::input
