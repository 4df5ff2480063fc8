#pragma once

#include "domain/BalanceHealthReport.hpp"
#include "domain/Money.hpp"
#include <cstdint>

namespace ledger::ports::input {

/**
 * @brief Контроль материализованных остатков
 */
class IBalanceHealthService {
public:
    virtual ~IBalanceHealthService() = default;

    /**
     * @brief Найти расхождения и проверить уравнение баланса
     */
    virtual domain::BalanceHealthReport checkHealth() = 0;

    /**
     * @brief Пересчитать остаток счёта по проведённым строкам и записать его
     * @return пересчитанный остаток
     */
    virtual domain::Money recomputeAccount(int64_t accountId) = 0;

    /**
     * @brief Пересчитать все счета с расхождениями
     */
    virtual domain::BalanceHealthReport autoHeal() = 0;
};

} // namespace ledger::ports::input
