#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Расхождение материализованного остатка с суммой проведённых строк
 */
struct BalanceDrift {
    int64_t accountId = 0;
    std::string code;
    Money materialized;
    Money recomputed;

    Money difference() const { return materialized - recomputed; }
};

/**
 * @brief Результат проверки: Активы = Обязательства + Капитал + (Доходы - Расходы)
 */
struct BalanceHealthReport {
    Timestamp checkedAt;
    Money totalAssets;
    Money totalLiabilities;
    Money totalEquity;
    Money totalRevenue;
    Money totalExpenses;
    bool equationHolds = true;
    std::vector<BalanceDrift> drifts;
    int healedAccounts = 0;

    Money equationDifference() const {
        return totalAssets - (totalLiabilities + totalEquity + (totalRevenue - totalExpenses));
    }

    bool isHealthy() const {
        return equationHolds && drifts.empty();
    }
};

} // namespace ledger::domain
