#pragma once

namespace ledger::domain::codes {

/**
 * @brief Коды счетов, на которые опираются адаптеры источников
 *
 * Если какого-то счёта нет в плане счетов, адаптер падает
 * с IntegrityException, ничего не проводя.
 */
constexpr const char* CASH = "1101";
constexpr const char* BANK = "1102";
constexpr const char* ACCOUNTS_RECEIVABLE = "1201";
constexpr const char* INPUT_VAT = "1240";
constexpr const char* PREPAID_INCOME_TAX = "1250";
constexpr const char* INVENTORY = "1301";
constexpr const char* ACCOUNTS_PAYABLE = "2101";
constexpr const char* OUTPUT_VAT = "2103";
constexpr const char* WITHHOLDING_TAX_21 = "2111";
constexpr const char* WITHHOLDING_TAX_23 = "2112";
constexpr const char* SALES_REVENUE = "4101";
constexpr const char* COST_OF_GOODS_SOLD = "5101";

} // namespace ledger::domain::codes
