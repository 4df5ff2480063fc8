#pragma once

#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Задача проводки, которую не удалось выполнить
 */
struct DeadLetter {
    int64_t id = 0;
    std::string taskName;
    std::string payload;    ///< JSON исходного события
    std::string lastError;
    int attempts = 0;
    Timestamp failedAt;
};

} // namespace ledger::domain
