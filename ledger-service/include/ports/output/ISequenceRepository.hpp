#pragma once

#include <string>
#include <cstdint>

namespace ledger::ports::output {

/**
 * @brief Счётчики номеров проводок по префиксам
 */
class ISequenceRepository {
public:
    virtual ~ISequenceRepository() = default;

    /**
     * @brief Увеличить счётчик префикса под блокировкой строки и вернуть новое значение
     *
     * Откат транзакции откатывает и увеличение.
     * @throws domain::ConcurrencyException(SEQUENCE_CONTENTION) при таймауте блокировки
     */
    virtual int64_t nextValue(const std::string& prefix) = 0;
};

} // namespace ledger::ports::output
