#pragma once

#include "ports/input/IJournalService.hpp"
#include "ports/output/ILedgerUnitOfWork.hpp"
#include "ports/output/IAccountCatalog.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/LedgerValidator.hpp"
#include "application/SequenceGenerator.hpp"
#include "application/BalanceMaterializer.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/LedgerErrors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <thread>
#include <memory>
#include <iostream>
#include <map>
#include <set>

namespace ledger::application {

/**
 * @brief Проведение проводок: validate -> persist -> materialize
 *
 * Каждая операция выполняется в одной транзакции ILedgerSession.
 * Ошибка на любом шаге откатывает всё: номер, заголовок, строки, остатки.
 *
 * ConcurrencyException (борьба за счётчик / строку счёта) повторяется
 * целиком с экспоненциальной задержкой.
 *
 * После commit публикуются journal.posted / journal.reversed
 * и сбрасывается кэш затронутых счетов.
 */
class JournalPostingEngine : public ports::input::IJournalService {
public:
    JournalPostingEngine(
        std::shared_ptr<ports::output::ILedgerUnitOfWork> unitOfWork,
        std::shared_ptr<ports::output::IAccountCatalog> accountCatalog,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : unitOfWork_(std::move(unitOfWork))
      , accountCatalog_(std::move(accountCatalog))
      , eventPublisher_(std::move(eventPublisher))
      , settings_(std::move(settings))
      , validator_(settings_)
      , sequenceGenerator_(settings_)
    {
        std::cout << "[JournalPostingEngine] Created" << std::endl;
    }

    domain::JournalEntrySummary createEntry(const domain::JournalEntryRequest& request) override {
        return withRetry("createEntry", [&]() { return createOnce(request); });
    }

    domain::JournalEntrySummary postEntry(int64_t entryId, const std::string& actor) override {
        return withRetry("postEntry", [&]() { return postOnce(entryId, actor); });
    }

    domain::JournalEntrySummary reverseEntry(int64_t entryId,
                                             const std::string& reason,
                                             const std::string& actor) override {
        return withRetry("reverseEntry", [&]() { return reverseOnce(entryId, reason, actor); });
    }

    std::optional<domain::JournalEntry> getEntry(int64_t entryId) override {
        auto session = unitOfWork_->begin();
        auto entry = session->entries().findById(entryId);
        session->rollback();
        return entry;
    }

private:
    std::shared_ptr<ports::output::ILedgerUnitOfWork> unitOfWork_;
    std::shared_ptr<ports::output::IAccountCatalog> accountCatalog_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    LedgerValidator validator_;
    SequenceGenerator sequenceGenerator_;
    BalanceMaterializer materializer_;

    // ============================================
    // ОПЕРАЦИИ (одна попытка = одна транзакция)
    // ============================================

    domain::JournalEntrySummary createOnce(const domain::JournalEntryRequest& request) {
        auto session = unitOfWork_->begin();

        if (request.sourceId) {
            session->entries().lockSource(request.sourceType, *request.sourceId);
            auto existing = session->entries().findActiveBySource(request.sourceType, *request.sourceId);
            if (existing) {
                session->rollback();
                std::cout << "[JournalPostingEngine] Duplicate source " << domain::toString(request.sourceType)
                          << "#" << *request.sourceId << " -> " << existing->entryNumber << std::endl;
                // Черновик занимает источник; провести его можно только через postEntry
                if (request.autoPost && existing->status == domain::JournalStatus::DRAFT) {
                    std::cerr << "[JournalPostingEngine] WARNING: source " << domain::toString(request.sourceType)
                              << "#" << *request.sourceId << " is held by draft " << existing->entryNumber
                              << ", nothing posted" << std::endl;
                }
                return domain::JournalEntrySummary::of(*existing, true, settings_->getTolerance());
            }
        }

        domain::JournalEntry entry = buildEntry(request);
        auto accounts = loadAccounts(*session, entry);
        validator_.validateOrThrow(entry, accounts);

        entry.entryNumber = sequenceGenerator_.nextEntryNumber(session->sequences(), request.sourceType);
        auto saved = session->entries().insert(entry);

        std::vector<int64_t> touched;
        if (request.autoPost) {
            touched = materializer_.applyEntry(*session, saved, accounts);
            auto postedAt = domain::Timestamp::now();
            session->entries().markPosted(saved.id, postedAt);
            saved.status = domain::JournalStatus::POSTED;
            saved.postedAt = postedAt;
        }

        session->commit();

        std::cout << "[JournalPostingEngine] Created " << saved.entryNumber
                  << " status=" << domain::toString(saved.status)
                  << " total=" << saved.totalDebit.toString() << std::endl;

        if (request.autoPost) {
            afterPosting("journal.posted", saved, touched);
        }
        return domain::JournalEntrySummary::of(saved, false, settings_->getTolerance());
    }

    domain::JournalEntrySummary postOnce(int64_t entryId, const std::string& actor) {
        auto session = unitOfWork_->begin();

        auto entry = session->entries().findById(entryId, true);
        if (!entry) {
            throw domain::EntryNotFoundException(entryId);
        }
        if (entry->status == domain::JournalStatus::POSTED) {
            throw domain::StateException(domain::StateException::Code::ALREADY_POSTED,
                                         "Entry " + entry->entryNumber + " is already posted");
        }
        if (entry->status == domain::JournalStatus::REVERSED) {
            throw domain::StateException(domain::StateException::Code::ALREADY_REVERSED,
                                         "Entry " + entry->entryNumber + " is reversed");
        }

        // Черновик мог пролежать долго: счета могли закрыть
        auto accounts = loadAccounts(*session, *entry);
        validator_.validateOrThrow(*entry, accounts);

        auto touched = materializer_.applyEntry(*session, *entry, accounts);
        auto postedAt = domain::Timestamp::now();
        session->entries().markPosted(entry->id, postedAt);
        session->commit();

        entry->status = domain::JournalStatus::POSTED;
        entry->postedAt = postedAt;

        std::cout << "[JournalPostingEngine] Posted " << entry->entryNumber << " by " << actor << std::endl;

        afterPosting("journal.posted", *entry, touched);
        return domain::JournalEntrySummary::of(*entry, false, settings_->getTolerance());
    }

    domain::JournalEntrySummary reverseOnce(int64_t entryId,
                                            const std::string& reason,
                                            const std::string& actor) {
        auto session = unitOfWork_->begin();

        auto original = session->entries().findById(entryId, true);
        if (!original) {
            throw domain::EntryNotFoundException(entryId);
        }
        if (original->status == domain::JournalStatus::DRAFT) {
            throw domain::StateException(domain::StateException::Code::NOT_POSTED,
                                         "Entry " + original->entryNumber + " is not posted");
        }
        if (original->status == domain::JournalStatus::REVERSED) {
            throw domain::StateException(domain::StateException::Code::ALREADY_REVERSED,
                                         "Entry " + original->entryNumber + " is already reversed");
        }

        domain::JournalEntry reversal = buildReversal(*original, reason, actor);
        auto accounts = loadAccounts(*session, reversal);
        validator_.validateOrThrow(reversal, accounts, true);

        reversal.entryNumber = sequenceGenerator_.nextEntryNumber(session->sequences(),
                                                                  domain::SourceType::REVERSAL);
        auto saved = session->entries().insert(reversal);

        auto touched = materializer_.applyEntry(*session, saved, accounts);
        auto postedAt = domain::Timestamp::now();
        session->entries().markPosted(saved.id, postedAt);
        session->entries().markReversed(original->id, saved.id, reason);
        session->commit();

        saved.status = domain::JournalStatus::POSTED;
        saved.postedAt = postedAt;

        std::cout << "[JournalPostingEngine] Reversed " << original->entryNumber
                  << " with " << saved.entryNumber << " by " << actor << std::endl;

        afterPosting("journal.reversed", saved, touched);
        return domain::JournalEntrySummary::of(saved, false, settings_->getTolerance());
    }

    // ============================================
    // ВСПОМОГАТЕЛЬНЫЕ
    // ============================================

    template <typename Fn>
    domain::JournalEntrySummary withRetry(const char* operation, Fn&& fn) {
        int maxAttempts = std::max(1, settings_->getPostMaxAttempts());
        auto backoff = settings_->getPostRetryBackoff();

        for (int attempt = 1;; ++attempt) {
            try {
                return fn();
            } catch (const domain::ConcurrencyException& e) {
                if (attempt >= maxAttempts) {
                    std::cerr << "[JournalPostingEngine] " << operation << " gave up after "
                              << attempt << " attempts: " << e.what() << std::endl;
                    throw;
                }
                std::cerr << "[JournalPostingEngine] " << operation << " attempt " << attempt
                          << " failed (" << domain::toString(e.code()) << "), retrying in "
                          << backoff.count() << "ms" << std::endl;
                std::this_thread::sleep_for(backoff);
                backoff *= 2;
            }
        }
    }

    static domain::JournalEntry buildEntry(const domain::JournalEntryRequest& request) {
        domain::JournalEntry entry;
        entry.sourceType = request.sourceType;
        entry.sourceId = request.sourceId;
        entry.reference = request.reference;
        entry.entryDate = request.entryDate.startOfDay();
        entry.description = request.description;
        entry.status = domain::JournalStatus::DRAFT;
        entry.createdBy = request.createdBy;
        entry.createdAt = domain::Timestamp::now();

        int lineNumber = 0;
        for (const auto& req : request.lines) {
            domain::JournalLine line;
            line.lineNumber = ++lineNumber;
            line.accountId = req.accountId;
            line.description = req.description;
            line.debitAmount = req.debitAmount;
            line.creditAmount = req.creditAmount;
            entry.lines.push_back(line);
        }
        entry.recalculateTotals();
        return entry;
    }

    static domain::JournalEntry buildReversal(const domain::JournalEntry& original,
                                              const std::string& reason,
                                              const std::string& actor) {
        domain::JournalEntry reversal;
        reversal.sourceType = domain::SourceType::REVERSAL;
        reversal.sourceId = original.id;
        reversal.reversalOfId = original.id;
        reversal.reference = "REV-" + (original.reference.empty() ? original.entryNumber : original.reference);
        reversal.entryDate = domain::Timestamp::now().startOfDay();
        reversal.description = "Reversal of " + original.entryNumber + (reason.empty() ? "" : ": " + reason);
        reversal.reversalReason = reason;
        reversal.status = domain::JournalStatus::DRAFT;
        reversal.createdBy = actor;
        reversal.createdAt = domain::Timestamp::now();

        for (const auto& line : original.lines) {
            domain::JournalLine swapped;
            swapped.lineNumber = line.lineNumber;
            swapped.accountId = line.accountId;
            swapped.description = line.description;
            swapped.debitAmount = line.creditAmount;
            swapped.creditAmount = line.debitAmount;
            reversal.lines.push_back(swapped);
        }
        reversal.recalculateTotals();
        return reversal;
    }

    static std::map<int64_t, domain::Account> loadAccounts(ports::output::ILedgerSession& session,
                                                           const domain::JournalEntry& entry) {
        std::set<int64_t> ids;
        for (const auto& line : entry.lines) {
            ids.insert(line.accountId);
        }

        std::map<int64_t, domain::Account> accounts;
        for (auto& account : session.accounts().findByIds(std::vector<int64_t>(ids.begin(), ids.end()))) {
            accounts.emplace(account.id, std::move(account));
        }
        return accounts;
    }

    /**
     * @brief Уведомления после commit; проводку они уже не отменяют
     */
    void afterPosting(const std::string& routingKey,
                      const domain::JournalEntry& entry,
                      const std::vector<int64_t>& touchedAccounts) {
        accountCatalog_->invalidate(touchedAccounts);

        if (!eventPublisher_) return;

        try {
            nlohmann::json event;
            event["entry_id"] = entry.id;
            event["entry_number"] = entry.entryNumber;
            event["source_type"] = domain::toString(entry.sourceType);
            if (entry.sourceId) {
                event["source_id"] = *entry.sourceId;
            }
            if (entry.reversalOfId) {
                event["reversal_of_id"] = *entry.reversalOfId;
            }
            event["reference"] = entry.reference;
            event["entry_date"] = entry.entryDate.toDateString();
            event["status"] = domain::toString(entry.status);
            event["total_debit"] = entry.totalDebit.minor;
            event["total_credit"] = entry.totalCredit.minor;
            event["accounts"] = touchedAccounts;
            event["timestamp"] = domain::Timestamp::now().toString();

            eventPublisher_->publish(routingKey, event.dump());
        } catch (const std::exception& e) {
            std::cerr << "[JournalPostingEngine] Failed to publish " << routingKey
                      << " for " << entry.entryNumber << ": " << e.what() << std::endl;
        }
    }
};

} // namespace ledger::application
