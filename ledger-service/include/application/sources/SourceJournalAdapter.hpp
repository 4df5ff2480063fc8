#pragma once

#include "ports/input/IJournalService.hpp"
#include "ports/input/ILedgerQueryService.hpp"
#include "ports/output/IAccountCatalog.hpp"
#include "domain/AccountCodes.hpp"
#include "domain/LedgerErrors.hpp"
#include "domain/sources/PaymentMethod.hpp"
#include <memory>
#include <string>
#include <vector>
#include <iostream>

namespace ledger::application::sources {

/**
 * @brief Общая часть адаптеров Sales / Purchase / Payment
 *
 * Адаптер переводит документ в сбалансированный набор строк и отдаёт
 * его движку с autoPost = true и (sourceType, sourceId) для трассировки.
 * Повторная отправка того же документа вернёт уже созданную проводку.
 */
class SourceJournalAdapter {
public:
    virtual ~SourceJournalAdapter() = default;

    /**
     * @brief Сторнировать проводку документа
     * @throws domain::StateException(NOT_POSTED) если у документа нет проведённой проводки
     */
    domain::JournalEntrySummary reverseForSource(int64_t sourceId,
                                                 const std::string& reason,
                                                 const std::string& actor) {
        for (const auto& entry : queries_->getEntriesBySource(sourceType_, sourceId)) {
            if (entry.status == domain::JournalStatus::POSTED) {
                std::cout << "[" << tag_ << "] Reversing " << entry.entryNumber
                          << " for source #" << sourceId << std::endl;
                return journal_->reverseEntry(entry.id, reason, actor);
            }
        }
        throw domain::StateException(domain::StateException::Code::NOT_POSTED,
                                     "No posted entry for " + domain::toString(sourceType_) +
                                     "#" + std::to_string(sourceId));
    }

protected:
    SourceJournalAdapter(
        std::shared_ptr<ports::input::IJournalService> journal,
        std::shared_ptr<ports::input::ILedgerQueryService> queries,
        std::shared_ptr<ports::output::IAccountCatalog> accountCatalog,
        domain::SourceType sourceType,
        const char* tag
    ) : journal_(std::move(journal))
      , queries_(std::move(queries))
      , accountCatalog_(std::move(accountCatalog))
      , sourceType_(sourceType)
      , tag_(tag)
    {}

    /**
     * @throws domain::IntegrityException если счёта с таким кодом нет
     */
    int64_t requireAccount(const std::string& code) const {
        auto account = accountCatalog_->findByCode(code);
        if (!account) {
            throw domain::IntegrityException(std::string(tag_) + ": required account " + code +
                                             " is missing from the chart of accounts");
        }
        return account->id;
    }

    /**
     * @brief Счёт кассы / банка: явно указанный или по способу оплаты
     */
    int64_t resolveCashBankAccount(const std::optional<int64_t>& explicitId,
                                   domain::PaymentMethod method) const {
        if (explicitId) {
            if (!accountCatalog_->findById(*explicitId)) {
                throw domain::IntegrityException(std::string(tag_) + ": cash/bank account " +
                                                 std::to_string(*explicitId) + " not found");
            }
            return *explicitId;
        }
        return requireAccount(method == domain::PaymentMethod::CASH ? domain::codes::CASH
                                                                    : domain::codes::BANK);
    }

    domain::JournalEntrySummary post(int64_t sourceId,
                                     const std::string& reference,
                                     const domain::Timestamp& date,
                                     const std::string& description,
                                     std::vector<domain::JournalLineRequest> lines,
                                     const std::string& createdBy) {
        domain::JournalEntryRequest request;
        request.sourceType = sourceType_;
        request.sourceId = sourceId;
        request.reference = reference;
        request.entryDate = date;
        request.description = description;
        request.lines = std::move(lines);
        request.autoPost = true;
        request.createdBy = createdBy.empty() ? std::string("system") : createdBy;

        auto summary = journal_->createEntry(request);
        if (summary.duplicate) {
            std::cout << "[" << tag_ << "] Source #" << sourceId << " already journaled as "
                      << summary.entryNumber << std::endl;
        } else {
            std::cout << "[" << tag_ << "] Source #" << sourceId << " journaled as "
                      << summary.entryNumber << std::endl;
        }
        return summary;
    }

    static void addDebit(std::vector<domain::JournalLineRequest>& lines, int64_t accountId,
                         domain::Money amount, const std::string& description) {
        if (amount.isPositive()) {
            lines.push_back(domain::JournalLineRequest::debit(accountId, amount, description));
        }
    }

    static void addCredit(std::vector<domain::JournalLineRequest>& lines, int64_t accountId,
                          domain::Money amount, const std::string& description) {
        if (amount.isPositive()) {
            lines.push_back(domain::JournalLineRequest::credit(accountId, amount, description));
        }
    }

    std::shared_ptr<ports::input::IJournalService> journal_;
    std::shared_ptr<ports::input::ILedgerQueryService> queries_;
    std::shared_ptr<ports::output::IAccountCatalog> accountCatalog_;
    domain::SourceType sourceType_;
    const char* tag_;
};

} // namespace ledger::application::sources
