#pragma once

#include "ports/output/ILedgerUnitOfWork.hpp"
#include "domain/Account.hpp"
#include "domain/JournalEntry.hpp"
#include "domain/LedgerErrors.hpp"
#include <map>
#include <vector>
#include <iostream>

namespace ledger::application {

/**
 * @brief Материализованные остатки счетов
 *
 * Работает только внутри транзакции проводки, поэтому остаток
 * и журнал не могут разойтись.
 */
class BalanceMaterializer {
public:
    /**
     * @brief Изменение остатка в знаке нормального сальдо
     */
    static domain::Money computeDelta(domain::NormalBalance normalBalance,
                                      domain::Money debit, domain::Money credit) {
        return normalBalance == domain::NormalBalance::DEBIT ? debit - credit : credit - debit;
    }

    /**
     * @return новый остаток счёта
     */
    domain::Money applyPosting(ports::output::ILedgerSession& session,
                               const domain::Account& account,
                               domain::Money debit, domain::Money credit) const {
        auto delta = computeDelta(account.normalBalance(), debit, credit);
        return session.accounts().applyBalanceDelta(account.id, delta);
    }

    /**
     * @brief Применить все строки проводки
     *
     * Обороты сворачиваются по счетам и применяются по возрастанию id,
     * чтобы параллельные проводки брали блокировки строк в одном порядке.
     *
     * @return id затронутых счетов
     */
    std::vector<int64_t> applyEntry(ports::output::ILedgerSession& session,
                                    const domain::JournalEntry& entry,
                                    const std::map<int64_t, domain::Account>& accounts) const {
        std::map<int64_t, domain::LineTotals> perAccount;
        for (const auto& line : entry.lines) {
            auto& totals = perAccount[line.accountId];
            totals.debit += line.debitAmount;
            totals.credit += line.creditAmount;
        }

        std::vector<int64_t> touched;
        for (const auto& [accountId, totals] : perAccount) {
            auto it = accounts.find(accountId);
            if (it == accounts.end()) {
                throw domain::IntegrityException("Account disappeared during posting: " +
                                                 std::to_string(accountId));
            }
            applyPosting(session, it->second, totals.debit, totals.credit);
            touched.push_back(accountId);
        }
        return touched;
    }

    /**
     * @brief Остаток по всем проведённым строкам (без записи)
     */
    domain::Money computeExpected(ports::output::ILedgerSession& session,
                                  const domain::Account& account) const {
        auto totals = session.entries().sumLines(account.id, std::nullopt, false);
        return computeDelta(account.normalBalance(), totals.debit, totals.credit);
    }

    /**
     * @brief Пересчитать остаток по проведённым строкам и записать его
     * @throws domain::IntegrityException если счёта нет
     */
    domain::Money recompute(ports::output::ILedgerSession& session, int64_t accountId) const {
        auto account = session.accounts().findById(accountId);
        if (!account) {
            throw domain::IntegrityException("Account not found: " + std::to_string(accountId));
        }

        auto expected = computeExpected(session, *account);
        if (expected != account->currentBalance) {
            std::cout << "[BalanceMaterializer] Recomputed " << account->code << ": "
                      << account->currentBalance.toString() << " -> " << expected.toString() << std::endl;
        }
        session.accounts().setBalance(accountId, expected);
        return expected;
    }
};

} // namespace ledger::application
