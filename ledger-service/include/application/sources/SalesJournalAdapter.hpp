#pragma once

#include "application/sources/SourceJournalAdapter.hpp"
#include "domain/sources/Sale.hpp"
#include <optional>

namespace ledger::application::sources {

/**
 * @brief Проводки по продажам
 *
 * Проводятся только продажи в статусах INVOICED и PAID.
 *
 * Дт Касса/Банк/Дебиторка   total - withheldTax
 * Дт Предоплата налога      withheldTax
 *   Кт Выручка              subtotal
 *   Кт НДС к уплате         vat
 * Дт Себестоимость / Кт Запасы  costOfGoodsSold
 */
class SalesJournalAdapter : public SourceJournalAdapter {
public:
    SalesJournalAdapter(
        std::shared_ptr<ports::input::IJournalService> journal,
        std::shared_ptr<ports::input::ILedgerQueryService> queries,
        std::shared_ptr<ports::output::IAccountCatalog> accountCatalog
    ) : SourceJournalAdapter(std::move(journal), std::move(queries), std::move(accountCatalog),
                             domain::SourceType::SALES, "SalesJournalAdapter")
    {}

    static bool shouldPost(const domain::Sale& sale) {
        return sale.status == domain::SaleStatus::INVOICED || sale.status == domain::SaleStatus::PAID;
    }

    /**
     * @return std::nullopt, если продажа ещё не в проводимом статусе
     */
    std::optional<domain::JournalEntrySummary> postSale(const domain::Sale& sale) {
        if (!shouldPost(sale)) {
            std::cout << "[SalesJournalAdapter] Skip sale #" << sale.id
                      << " in status " << domain::toString(sale.status) << std::endl;
            return std::nullopt;
        }

        auto lines = buildJournalLines(sale);
        return post(sale.id, sale.invoiceNumber, sale.date,
                    "Sales invoice " + sale.invoiceNumber +
                        (sale.customerName.empty() ? "" : " - " + sale.customerName),
                    std::move(lines), sale.createdBy);
    }

    /**
     * @throws domain::ValidationException если суммы документа не сходятся
     * @throws domain::IntegrityException если нет обязательного счёта
     */
    std::vector<domain::JournalLineRequest> buildJournalLines(const domain::Sale& sale) const {
        validateSale(sale);

        std::vector<domain::JournalLineRequest> lines;
        const std::string ref = sale.invoiceNumber;

        int64_t receiptAccount = sale.paymentMethod == domain::PaymentMethod::CREDIT
            ? requireAccount(domain::codes::ACCOUNTS_RECEIVABLE)
            : resolveCashBankAccount(sale.cashBankAccountId, sale.paymentMethod);

        addDebit(lines, receiptAccount, sale.total - sale.withheldTax, "Receipt " + ref);
        if (sale.withheldTax.isPositive()) {
            addDebit(lines, requireAccount(domain::codes::PREPAID_INCOME_TAX), sale.withheldTax,
                     "Tax withheld by customer " + ref);
        }
        addCredit(lines, requireAccount(domain::codes::SALES_REVENUE), sale.subtotal, "Revenue " + ref);
        if (sale.vat.isPositive()) {
            addCredit(lines, requireAccount(domain::codes::OUTPUT_VAT), sale.vat, "Output VAT " + ref);
        }

        if (sale.costOfGoodsSold.isPositive()) {
            addDebit(lines, requireAccount(domain::codes::COST_OF_GOODS_SOLD), sale.costOfGoodsSold,
                     "COGS " + ref);
            addCredit(lines, requireAccount(domain::codes::INVENTORY), sale.costOfGoodsSold,
                      "Inventory out " + ref);
        }

        return lines;
    }

private:
    static void validateSale(const domain::Sale& sale) {
        std::vector<std::string> errors;
        if (sale.subtotal.isNegative() || sale.vat.isNegative() || sale.withheldTax.isNegative() ||
            sale.costOfGoodsSold.isNegative()) {
            errors.push_back("sale amounts must not be negative");
        }
        if (!sale.total.isPositive()) {
            errors.push_back("sale total must be positive");
        }
        if (sale.total != sale.subtotal + sale.vat) {
            errors.push_back("sale total " + sale.total.toString() + " != subtotal + VAT " +
                             (sale.subtotal + sale.vat).toString());
        }
        if (sale.withheldTax > sale.total) {
            errors.push_back("withheld tax exceeds sale total");
        }
        if (!errors.empty()) {
            throw domain::ValidationException(errors);
        }
    }
};

} // namespace ledger::application::sources
