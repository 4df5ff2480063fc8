#pragma once

#include "PaymentMethod.hpp"
#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace ledger::domain {

struct PurchaseItem {
    std::string description;
    Money amount;
    std::optional<int64_t> expenseAccountId;  ///< если пусто, идёт на Запасы
};

/**
 * @brief Закупка у поставщика
 *
 * total = сумма позиций + vat. НДФЛ-удержания (pph21 / pph23)
 * уменьшают сумму к оплате поставщику.
 */
struct Purchase {
    int64_t id = 0;
    std::string code;
    std::string vendorName;
    Timestamp date;
    PaymentMethod paymentMethod = PaymentMethod::CREDIT;
    std::optional<int64_t> cashBankAccountId;
    std::vector<PurchaseItem> items;
    Money vat;
    Money pph21;
    Money pph23;
    Money total;
    std::string createdBy;

    Money itemsTotal() const {
        Money sum;
        for (const auto& item : items) {
            sum += item.amount;
        }
        return sum;
    }
};

} // namespace ledger::domain
