#pragma once

#include <string>
#include <vector>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Источник проводки
 */
enum class SourceType {
    MANUAL,
    SALES,
    PURCHASE,
    PAYMENT,
    CASH_BANK,
    CLOSING,
    ADJUSTMENT,
    REVERSAL
};

inline std::string toString(SourceType type) {
    switch (type) {
        case SourceType::MANUAL:     return "MANUAL";
        case SourceType::SALES:      return "SALES";
        case SourceType::PURCHASE:   return "PURCHASE";
        case SourceType::PAYMENT:    return "PAYMENT";
        case SourceType::CASH_BANK:  return "CASH_BANK";
        case SourceType::CLOSING:    return "CLOSING";
        case SourceType::ADJUSTMENT: return "ADJUSTMENT";
        case SourceType::REVERSAL:   return "REVERSAL";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline SourceType sourceTypeFromString(const std::string& str) {
    if (str == "MANUAL")     return SourceType::MANUAL;
    if (str == "SALES")      return SourceType::SALES;
    if (str == "PURCHASE")   return SourceType::PURCHASE;
    if (str == "PAYMENT")    return SourceType::PAYMENT;
    if (str == "CASH_BANK")  return SourceType::CASH_BANK;
    if (str == "CLOSING")    return SourceType::CLOSING;
    if (str == "ADJUSTMENT") return SourceType::ADJUSTMENT;
    if (str == "REVERSAL")   return SourceType::REVERSAL;
    throw std::invalid_argument("Unknown SourceType: " + str);
}

inline const std::vector<SourceType>& allSourceTypes() {
    static const std::vector<SourceType> all = {
        SourceType::MANUAL, SourceType::SALES, SourceType::PURCHASE, SourceType::PAYMENT,
        SourceType::CASH_BANK, SourceType::CLOSING, SourceType::ADJUSTMENT, SourceType::REVERSAL
    };
    return all;
}

} // namespace ledger::domain
