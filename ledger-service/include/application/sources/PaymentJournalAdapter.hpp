#pragma once

#include "application/sources/SourceJournalAdapter.hpp"
#include "application/BalanceMaterializer.hpp"
#include "domain/sources/Payment.hpp"
#include <map>

namespace ledger::application::sources {

/**
 * @brief Прогноз изменения остатка счёта при проведении платежа
 */
struct BalanceProjection {
    int64_t accountId = 0;
    std::string code;
    domain::Money currentBalance;
    domain::Money change;
    domain::Money projectedBalance;
};

struct PaymentJournalPreview {
    std::vector<domain::JournalLineRequest> lines;
    std::vector<BalanceProjection> projections;
    domain::Money totalDebit;
    domain::Money totalCredit;

    bool isBalanced() const { return totalDebit == totalCredit; }
};

/**
 * @brief Проводки по платежам
 *
 * Поступление от покупателя:  Дт Касса/Банк  Кт Дебиторка
 * Оплата поставщику:          Дт Кредиторка  Кт Касса/Банк
 */
class PaymentJournalAdapter : public SourceJournalAdapter {
public:
    PaymentJournalAdapter(
        std::shared_ptr<ports::input::IJournalService> journal,
        std::shared_ptr<ports::input::ILedgerQueryService> queries,
        std::shared_ptr<ports::output::IAccountCatalog> accountCatalog
    ) : SourceJournalAdapter(std::move(journal), std::move(queries), std::move(accountCatalog),
                             domain::SourceType::PAYMENT, "PaymentJournalAdapter")
    {}

    domain::JournalEntrySummary postPayment(const domain::Payment& payment) {
        auto lines = buildJournalLines(payment);
        std::string description = (payment.kind == domain::PaymentKind::CUSTOMER ? "Payment received " : "Payment sent ") +
                                  payment.code +
                                  (payment.contactName.empty() ? "" : " - " + payment.contactName);
        return post(payment.id, payment.reference.empty() ? payment.code : payment.reference,
                    payment.date, description, std::move(lines), payment.createdBy);
    }

    /**
     * @throws domain::ValidationException при неверной сумме или способе оплаты
     * @throws domain::IntegrityException если нет обязательного счёта
     */
    std::vector<domain::JournalLineRequest> buildJournalLines(const domain::Payment& payment) const {
        validatePayment(payment);

        int64_t cashBank = resolveCashBankAccount(payment.cashBankAccountId, payment.method);
        std::vector<domain::JournalLineRequest> lines;

        if (payment.kind == domain::PaymentKind::CUSTOMER) {
            addDebit(lines, cashBank, payment.amount, "Receipt " + payment.code);
            addCredit(lines, requireAccount(domain::codes::ACCOUNTS_RECEIVABLE), payment.amount,
                      "Receivable settled " + payment.code);
        } else {
            addDebit(lines, requireAccount(domain::codes::ACCOUNTS_PAYABLE), payment.amount,
                     "Payable settled " + payment.code);
            addCredit(lines, cashBank, payment.amount, "Payment " + payment.code);
        }
        return lines;
    }

    /**
     * @brief Строки и ожидаемые остатки без записи в журнал
     */
    PaymentJournalPreview preview(const domain::Payment& payment) const {
        PaymentJournalPreview result;
        result.lines = buildJournalLines(payment);

        std::map<int64_t, domain::LineTotals> perAccount;
        for (const auto& line : result.lines) {
            result.totalDebit += line.debitAmount;
            result.totalCredit += line.creditAmount;
            perAccount[line.accountId].debit += line.debitAmount;
            perAccount[line.accountId].credit += line.creditAmount;
        }

        for (const auto& [accountId, totals] : perAccount) {
            auto account = accountCatalog_->findById(accountId);
            if (!account) {
                throw domain::IntegrityException("PaymentJournalAdapter: account " +
                                                 std::to_string(accountId) + " not found");
            }
            BalanceProjection projection;
            projection.accountId = accountId;
            projection.code = account->code;
            projection.currentBalance = account->currentBalance;
            projection.change = BalanceMaterializer::computeDelta(account->normalBalance(),
                                                                  totals.debit, totals.credit);
            projection.projectedBalance = projection.currentBalance + projection.change;
            result.projections.push_back(projection);
        }
        return result;
    }

private:
    static void validatePayment(const domain::Payment& payment) {
        std::vector<std::string> errors;
        if (!payment.amount.isPositive()) {
            errors.push_back("payment amount must be positive");
        }
        if (payment.method == domain::PaymentMethod::CREDIT) {
            errors.push_back("payment method CREDIT is not a cash movement");
        }
        if (payment.code.empty()) {
            errors.push_back("payment code is required");
        }
        if (!errors.empty()) {
            throw domain::ValidationException(errors);
        }
    }
};

} // namespace ledger::application::sources
