#pragma once

#include "application/sources/SourceJournalAdapter.hpp"
#include "domain/sources/Purchase.hpp"

namespace ledger::application::sources {

/**
 * @brief Проводки по закупкам
 *
 * Дт Запасы (или счёт расходов позиции)   по позициям
 * Дт НДС к возмещению                     vat
 *   Кт Касса/Банк или Кредиторка          total - pph21 - pph23
 *   Кт НДФЛ 21 / НДФЛ 23 к уплате         удержания
 */
class PurchaseJournalAdapter : public SourceJournalAdapter {
public:
    PurchaseJournalAdapter(
        std::shared_ptr<ports::input::IJournalService> journal,
        std::shared_ptr<ports::input::ILedgerQueryService> queries,
        std::shared_ptr<ports::output::IAccountCatalog> accountCatalog
    ) : SourceJournalAdapter(std::move(journal), std::move(queries), std::move(accountCatalog),
                             domain::SourceType::PURCHASE, "PurchaseJournalAdapter")
    {}

    domain::JournalEntrySummary postPurchase(const domain::Purchase& purchase) {
        auto lines = buildJournalLines(purchase);
        return post(purchase.id, purchase.code, purchase.date,
                    "Purchase " + purchase.code +
                        (purchase.vendorName.empty() ? "" : " - " + purchase.vendorName),
                    std::move(lines), purchase.createdBy);
    }

    /**
     * @throws domain::ValidationException если суммы документа не сходятся
     * @throws domain::IntegrityException если нет обязательного счёта
     */
    std::vector<domain::JournalLineRequest> buildJournalLines(const domain::Purchase& purchase) const {
        validatePurchase(purchase);

        std::vector<domain::JournalLineRequest> lines;
        const std::string ref = purchase.code;

        int64_t inventoryAccount = 0;
        for (const auto& item : purchase.items) {
            int64_t accountId = 0;
            if (item.expenseAccountId) {
                if (!accountCatalog_->findById(*item.expenseAccountId)) {
                    throw domain::IntegrityException("PurchaseJournalAdapter: expense account " +
                                                     std::to_string(*item.expenseAccountId) + " not found");
                }
                accountId = *item.expenseAccountId;
            } else {
                if (inventoryAccount == 0) {
                    inventoryAccount = requireAccount(domain::codes::INVENTORY);
                }
                accountId = inventoryAccount;
            }
            addDebit(lines, accountId, item.amount,
                     item.description.empty() ? "Purchase " + ref : item.description);
        }

        if (purchase.vat.isPositive()) {
            addDebit(lines, requireAccount(domain::codes::INPUT_VAT), purchase.vat, "Input VAT " + ref);
        }

        int64_t settlementAccount = purchase.paymentMethod == domain::PaymentMethod::CREDIT
            ? requireAccount(domain::codes::ACCOUNTS_PAYABLE)
            : resolveCashBankAccount(purchase.cashBankAccountId, purchase.paymentMethod);

        addCredit(lines, settlementAccount, purchase.total - purchase.pph21 - purchase.pph23,
                  purchase.paymentMethod == domain::PaymentMethod::CREDIT ? "Payable " + ref : "Paid " + ref);
        if (purchase.pph21.isPositive()) {
            addCredit(lines, requireAccount(domain::codes::WITHHOLDING_TAX_21), purchase.pph21,
                      "Withholding tax art.21 " + ref);
        }
        if (purchase.pph23.isPositive()) {
            addCredit(lines, requireAccount(domain::codes::WITHHOLDING_TAX_23), purchase.pph23,
                      "Withholding tax art.23 " + ref);
        }

        return lines;
    }

private:
    static void validatePurchase(const domain::Purchase& purchase) {
        std::vector<std::string> errors;
        if (purchase.items.empty()) {
            errors.push_back("purchase has no items");
        }
        for (const auto& item : purchase.items) {
            if (item.amount.isNegative()) {
                errors.push_back("purchase item amount must not be negative");
                break;
            }
        }
        if (purchase.vat.isNegative() || purchase.pph21.isNegative() || purchase.pph23.isNegative()) {
            errors.push_back("purchase taxes must not be negative");
        }
        if (purchase.total != purchase.itemsTotal() + purchase.vat) {
            errors.push_back("purchase total " + purchase.total.toString() + " != items + VAT " +
                             (purchase.itemsTotal() + purchase.vat).toString());
        }
        if (purchase.pph21 + purchase.pph23 > purchase.total) {
            errors.push_back("withholding taxes exceed purchase total");
        }
        if (!errors.empty()) {
            throw domain::ValidationException(errors);
        }
    }
};

} // namespace ledger::application::sources
