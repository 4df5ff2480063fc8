#pragma once

#include "ports/input/ILedgerQueryService.hpp"
#include "ports/output/ILedgerUnitOfWork.hpp"
#include "application/BalanceMaterializer.hpp"
#include "domain/LedgerErrors.hpp"
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Чтение журнала для отчётов
 *
 * Остатки на дату считаются по строкам, а не по currentBalance:
 * материализованный остаток знает только "сейчас".
 */
class LedgerQueryService : public ports::input::ILedgerQueryService {
public:
    explicit LedgerQueryService(std::shared_ptr<ports::output::ILedgerUnitOfWork> unitOfWork)
        : unitOfWork_(std::move(unitOfWork))
    {
        std::cout << "[LedgerQueryService] Created" << std::endl;
    }

    std::vector<domain::AccountBalance> getAccountBalances(
        const std::optional<domain::Timestamp>& asOf, bool includeDrafts = false) override
    {
        auto session = unitOfWork_->begin();
        auto accounts = session->accounts().findAll();
        auto totals = session->entries().totalsByAccount(asOf, includeDrafts);
        session->rollback();

        std::vector<domain::AccountBalance> result;
        result.reserve(accounts.size());
        for (const auto& account : accounts) {
            domain::AccountBalance balance;
            balance.accountId = account.id;
            balance.code = account.code;
            balance.name = account.name;
            balance.type = account.type;

            auto it = totals.find(account.id);
            if (it != totals.end()) {
                balance.debitTotal = it->second.debit;
                balance.creditTotal = it->second.credit;
            }
            balance.balance = BalanceMaterializer::computeDelta(
                account.normalBalance(), balance.debitTotal, balance.creditTotal);
            result.push_back(balance);
        }
        return result;
    }

    std::vector<domain::JournalEntry> getEntriesBySource(domain::SourceType sourceType,
                                                         int64_t sourceId,
                                                         bool includeDrafts = false) override {
        auto session = unitOfWork_->begin();
        auto entries = session->entries().findBySource(sourceType, sourceId, includeDrafts);
        session->rollback();
        return entries;
    }

    domain::AccountLedger getLedgerForAccount(
        int64_t accountId,
        const std::optional<domain::Timestamp>& from,
        const std::optional<domain::Timestamp>& to,
        bool includeDrafts = false) override
    {
        auto session = unitOfWork_->begin();

        auto account = session->accounts().findById(accountId);
        if (!account) {
            throw domain::IntegrityException("Account not found: " + std::to_string(accountId));
        }

        domain::AccountLedger ledger;
        ledger.accountId = account->id;
        ledger.code = account->code;
        ledger.name = account->name;
        ledger.from = from ? from->startOfDay() : domain::Timestamp::fromEpochSeconds(0);
        ledger.to = to ? *to : domain::Timestamp::now();

        if (from) {
            auto opening = session->entries().sumLines(accountId, from->startOfDay(), includeDrafts);
            ledger.openingBalance = BalanceMaterializer::computeDelta(
                account->normalBalance(), opening.debit, opening.credit);
        }

        auto activity = session->entries().findAccountActivity(
            accountId, from ? std::optional<domain::Timestamp>(from->startOfDay()) : std::nullopt, to, includeDrafts);
        session->rollback();

        domain::Money running = ledger.openingBalance;
        for (auto& item : activity) {
            running += BalanceMaterializer::computeDelta(
                account->normalBalance(), item.debitAmount, item.creditAmount);
            ledger.totalDebit += item.debitAmount;
            ledger.totalCredit += item.creditAmount;
            ledger.lines.push_back(domain::LedgerLine{std::move(item), running});
        }
        ledger.closingBalance = running;
        return ledger;
    }

    domain::JournalPage listEntries(const domain::JournalFilter& filter) override {
        auto session = unitOfWork_->begin();
        auto page = session->entries().list(filter);
        session->rollback();
        return page;
    }

private:
    std::shared_ptr<ports::output::ILedgerUnitOfWork> unitOfWork_;
};

} // namespace ledger::application
