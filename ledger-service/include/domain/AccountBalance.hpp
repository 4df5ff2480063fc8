#pragma once

#include "Money.hpp"
#include "enums/AccountType.hpp"
#include <string>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Обороты по счёту: сумма дебетов и кредитов строк
 */
struct LineTotals {
    Money debit;
    Money credit;
};

/**
 * @brief Остаток счёта на дату, посчитанный по проведённым строкам
 */
struct AccountBalance {
    int64_t accountId = 0;
    std::string code;
    std::string name;
    AccountType type = AccountType::ASSET;
    Money debitTotal;
    Money creditTotal;
    Money balance;  ///< в знаке нормального сальдо
};

} // namespace ledger::domain
