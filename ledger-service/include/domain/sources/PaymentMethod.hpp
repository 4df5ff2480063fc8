#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Способ оплаты документа-источника
 */
enum class PaymentMethod {
    CASH,
    BANK,
    TRANSFER,
    CHECK,
    CREDIT   ///< отсрочка: дебиторская / кредиторская задолженность
};

inline std::string toString(PaymentMethod method) {
    switch (method) {
        case PaymentMethod::CASH:     return "CASH";
        case PaymentMethod::BANK:     return "BANK";
        case PaymentMethod::TRANSFER: return "TRANSFER";
        case PaymentMethod::CHECK:    return "CHECK";
        case PaymentMethod::CREDIT:   return "CREDIT";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline PaymentMethod paymentMethodFromString(const std::string& str) {
    if (str == "CASH")     return PaymentMethod::CASH;
    if (str == "BANK")     return PaymentMethod::BANK;
    if (str == "TRANSFER") return PaymentMethod::TRANSFER;
    if (str == "CHECK")    return PaymentMethod::CHECK;
    if (str == "CREDIT")   return PaymentMethod::CREDIT;
    throw std::invalid_argument("Unknown PaymentMethod: " + str);
}

} // namespace ledger::domain
