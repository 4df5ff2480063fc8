#pragma once

#include "PaymentMethod.hpp"
#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <optional>
#include <stdexcept>
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Направление платежа
 */
enum class PaymentKind {
    CUSTOMER,  ///< поступление от покупателя
    VENDOR     ///< оплата поставщику
};

inline std::string toString(PaymentKind kind) {
    return kind == PaymentKind::CUSTOMER ? "CUSTOMER" : "VENDOR";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline PaymentKind paymentKindFromString(const std::string& str) {
    if (str == "CUSTOMER" || str == "RECEIVABLE") return PaymentKind::CUSTOMER;
    if (str == "VENDOR" || str == "PAYABLE")      return PaymentKind::VENDOR;
    throw std::invalid_argument("Unknown PaymentKind: " + str);
}

struct Payment {
    int64_t id = 0;
    std::string code;
    PaymentKind kind = PaymentKind::CUSTOMER;
    std::string contactName;
    Timestamp date;
    Money amount;
    PaymentMethod method = PaymentMethod::BANK;
    std::optional<int64_t> cashBankAccountId;
    std::string reference;
    std::string notes;
    std::string createdBy;
};

} // namespace ledger::domain
