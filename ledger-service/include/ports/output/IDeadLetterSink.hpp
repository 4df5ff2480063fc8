#pragma once

#include "domain/DeadLetter.hpp"
#include <vector>
#include <cstddef>

namespace ledger::ports::output {

/**
 * @brief Хранилище задач проводки, которые не удалось выполнить
 */
class IDeadLetterSink {
public:
    virtual ~IDeadLetterSink() = default;

    virtual void put(const domain::DeadLetter& letter) = 0;

    /**
     * @brief Последние записи, новые первыми
     */
    virtual std::vector<domain::DeadLetter> list(size_t limit) = 0;

    virtual size_t count() = 0;
};

} // namespace ledger::ports::output
