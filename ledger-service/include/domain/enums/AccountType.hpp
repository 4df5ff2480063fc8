#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Тип счёта плана счетов
 */
enum class AccountType {
    ASSET,      ///< Активы
    LIABILITY,  ///< Обязательства
    EQUITY,     ///< Капитал
    REVENUE,    ///< Доходы
    EXPENSE     ///< Расходы
};

/**
 * @brief Нормальное сальдо счёта
 */
enum class NormalBalance {
    DEBIT,
    CREDIT
};

inline std::string toString(AccountType type) {
    switch (type) {
        case AccountType::ASSET:     return "ASSET";
        case AccountType::LIABILITY: return "LIABILITY";
        case AccountType::EQUITY:    return "EQUITY";
        case AccountType::REVENUE:   return "REVENUE";
        case AccountType::EXPENSE:   return "EXPENSE";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountType accountTypeFromString(const std::string& str) {
    if (str == "ASSET")     return AccountType::ASSET;
    if (str == "LIABILITY") return AccountType::LIABILITY;
    if (str == "EQUITY")    return AccountType::EQUITY;
    if (str == "REVENUE")   return AccountType::REVENUE;
    if (str == "EXPENSE")   return AccountType::EXPENSE;
    throw std::invalid_argument("Unknown AccountType: " + str);
}

/**
 * @brief Активы и расходы растут по дебету, остальные по кредиту
 */
inline NormalBalance normalBalanceOf(AccountType type) {
    switch (type) {
        case AccountType::ASSET:
        case AccountType::EXPENSE:
            return NormalBalance::DEBIT;
        default:
            return NormalBalance::CREDIT;
    }
}

inline std::string toString(NormalBalance nb) {
    return nb == NormalBalance::DEBIT ? "DEBIT" : "CREDIT";
}

} // namespace ledger::domain
