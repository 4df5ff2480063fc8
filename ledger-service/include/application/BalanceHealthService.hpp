#pragma once

#include "ports/input/IBalanceHealthService.hpp"
#include "ports/output/ILedgerUnitOfWork.hpp"
#include "ports/output/IAccountCatalog.hpp"
#include "application/BalanceMaterializer.hpp"
#include "settings/LedgerSettings.hpp"
#include <memory>
#include <iostream>

namespace ledger::application {

/**
 * @brief Сверка материализованных остатков с журналом
 *
 * Источник истины - проведённые строки. currentBalance только кэш,
 * и при расхождении он пересчитывается (autoHeal / recomputeAccount).
 */
class BalanceHealthService : public ports::input::IBalanceHealthService {
public:
    BalanceHealthService(
        std::shared_ptr<ports::output::ILedgerUnitOfWork> unitOfWork,
        std::shared_ptr<ports::output::IAccountCatalog> accountCatalog,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : unitOfWork_(std::move(unitOfWork))
      , accountCatalog_(std::move(accountCatalog))
      , settings_(std::move(settings))
    {
        std::cout << "[BalanceHealthService] Created" << std::endl;
    }

    domain::BalanceHealthReport checkHealth() override {
        auto session = unitOfWork_->begin();
        auto report = inspect(*session);
        session->rollback();

        if (report.isHealthy()) {
            std::cout << "[BalanceHealthService] Healthy" << std::endl;
        } else {
            std::cerr << "[BalanceHealthService] Drifted accounts: " << report.drifts.size()
                      << ", equation difference: " << report.equationDifference().toString() << std::endl;
        }
        return report;
    }

    domain::Money recomputeAccount(int64_t accountId) override {
        auto session = unitOfWork_->begin();
        auto balance = materializer_.recompute(*session, accountId);
        session->commit();

        accountCatalog_->invalidate({accountId});
        return balance;
    }

    domain::BalanceHealthReport autoHeal() override {
        auto session = unitOfWork_->begin();
        auto report = inspect(*session);

        std::vector<int64_t> healed;
        for (const auto& drift : report.drifts) {
            materializer_.recompute(*session, drift.accountId);
            healed.push_back(drift.accountId);
        }
        session->commit();

        report.healedAccounts = static_cast<int>(healed.size());
        if (!healed.empty()) {
            accountCatalog_->invalidate(healed);
            std::cout << "[BalanceHealthService] Healed " << healed.size() << " accounts" << std::endl;
        }
        return report;
    }

private:
    std::shared_ptr<ports::output::ILedgerUnitOfWork> unitOfWork_;
    std::shared_ptr<ports::output::IAccountCatalog> accountCatalog_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    BalanceMaterializer materializer_;

    domain::BalanceHealthReport inspect(ports::output::ILedgerSession& session) const {
        domain::BalanceHealthReport report;
        report.checkedAt = domain::Timestamp::now();

        for (const auto& account : session.accounts().findAll()) {
            auto expected = materializer_.computeExpected(session, account);
            if (expected != account.currentBalance) {
                report.drifts.push_back(domain::BalanceDrift{
                    account.id, account.code, account.currentBalance, expected});
            }

            switch (account.type) {
                case domain::AccountType::ASSET:     report.totalAssets += expected; break;
                case domain::AccountType::LIABILITY: report.totalLiabilities += expected; break;
                case domain::AccountType::EQUITY:    report.totalEquity += expected; break;
                case domain::AccountType::REVENUE:   report.totalRevenue += expected; break;
                case domain::AccountType::EXPENSE:   report.totalExpenses += expected; break;
            }
        }

        report.equationHolds = report.equationDifference().abs() <= settings_->getTolerance();
        return report;
    }
};

} // namespace ledger::application
