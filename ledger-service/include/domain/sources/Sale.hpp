#pragma once

#include "PaymentMethod.hpp"
#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <optional>
#include <stdexcept>
#include <cstdint>

namespace ledger::domain {

enum class SaleStatus {
    DRAFT,
    CONFIRMED,
    INVOICED,
    PAID,
    CANCELLED
};

inline std::string toString(SaleStatus status) {
    switch (status) {
        case SaleStatus::DRAFT:     return "DRAFT";
        case SaleStatus::CONFIRMED: return "CONFIRMED";
        case SaleStatus::INVOICED:  return "INVOICED";
        case SaleStatus::PAID:      return "PAID";
        case SaleStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline SaleStatus saleStatusFromString(const std::string& str) {
    if (str == "DRAFT")     return SaleStatus::DRAFT;
    if (str == "CONFIRMED") return SaleStatus::CONFIRMED;
    if (str == "INVOICED")  return SaleStatus::INVOICED;
    if (str == "PAID")      return SaleStatus::PAID;
    if (str == "CANCELLED") return SaleStatus::CANCELLED;
    throw std::invalid_argument("Unknown SaleStatus: " + str);
}

/**
 * @brief Продажа (счёт-фактура клиенту)
 *
 * total = subtotal + vat. Удержанный покупателем налог (withheldTax)
 * уменьшает сумму к получению.
 */
struct Sale {
    int64_t id = 0;
    std::string invoiceNumber;
    std::string customerName;
    Timestamp date;
    SaleStatus status = SaleStatus::DRAFT;
    PaymentMethod paymentMethod = PaymentMethod::CREDIT;
    std::optional<int64_t> cashBankAccountId;
    Money subtotal;
    Money vat;
    Money withheldTax;
    Money total;
    Money costOfGoodsSold;
    std::string createdBy;
};

} // namespace ledger::domain
