/**
 * @file JournalPostingEngineTest.cpp
 * @brief Unit tests for JournalPostingEngine
 */

#include <gtest/gtest.h>
#include "application/JournalPostingEngine.hpp"
#include "application/LedgerQueryService.hpp"
#include "adapters/secondary/memory/InMemoryLedgerStore.hpp"
#include "../mocks/MockEventPublisher.hpp"
#include "../mocks/FlakyUnitOfWork.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

using namespace ledger;
using namespace ledger::application;
using namespace ledger::tests;

namespace {
constexpr int64_t CASH = 1;
constexpr int64_t BANK = 2;
constexpr int64_t RECEIVABLE = 3;
constexpr int64_t REVENUE = 12;
}

class JournalPostingEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::LedgerSettings>();
        settings_->setPostRetryBackoff(std::chrono::milliseconds(1));
        settings_->setPostMaxAttempts(3);

        store_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>(settings_);
        store_->seedDefaultChart();
        flaky_ = std::make_shared<FlakyUnitOfWork>(store_);
        publisher_ = std::make_shared<MockEventPublisher>();

        engine_ = std::make_shared<JournalPostingEngine>(flaky_, store_, publisher_, settings_);
        queries_ = std::make_shared<LedgerQueryService>(store_);
    }

    static domain::JournalEntryRequest cashSale(int64_t minor, bool autoPost = true) {
        domain::JournalEntryRequest request;
        request.reference = "INV-001";
        request.entryDate = domain::Timestamp::date(2024, 3, 15);
        request.description = "Cash sale";
        request.lines = {
            domain::JournalLineRequest::debit(CASH, domain::Money(minor), "Cash in"),
            domain::JournalLineRequest::credit(REVENUE, domain::Money(minor), "Revenue")
        };
        request.autoPost = autoPost;
        request.createdBy = "tester";
        return request;
    }

    static domain::JournalEntryRequest customerPayment(int64_t sourceId, int64_t minor) {
        domain::JournalEntryRequest request;
        request.sourceType = domain::SourceType::PAYMENT;
        request.sourceId = sourceId;
        request.reference = "PAY-" + std::to_string(sourceId);
        request.entryDate = domain::Timestamp::date(2024, 3, 20);
        request.description = "Customer payment";
        request.lines = {
            domain::JournalLineRequest::debit(BANK, domain::Money(minor)),
            domain::JournalLineRequest::credit(RECEIVABLE, domain::Money(minor))
        };
        request.autoPost = true;
        return request;
    }

    domain::Money balance(int64_t accountId) {
        return store_->findById(accountId)->currentBalance;
    }

    int64_t entryCount() {
        domain::JournalFilter filter;
        filter.limit = 1000;
        return queries_->listEntries(filter).total;
    }

    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store_;
    std::shared_ptr<FlakyUnitOfWork> flaky_;
    std::shared_ptr<MockEventPublisher> publisher_;
    std::shared_ptr<JournalPostingEngine> engine_;
    std::shared_ptr<LedgerQueryService> queries_;
};

// ============================================================================
// CREATE
// ============================================================================

TEST_F(JournalPostingEngineTest, AutoPost_PostsAndMaterializesBalances) {
    auto summary = engine_->createEntry(cashSale(100000));

    EXPECT_EQ(summary.status, domain::JournalStatus::POSTED);
    EXPECT_EQ(summary.entryNumber, "JE-00001");
    EXPECT_EQ(summary.totalDebit, domain::Money(100000));
    EXPECT_EQ(summary.totalCredit, domain::Money(100000));
    EXPECT_TRUE(summary.isBalanced);
    EXPECT_FALSE(summary.duplicate);

    EXPECT_EQ(balance(CASH), domain::Money(100000));
    EXPECT_EQ(balance(REVENUE), domain::Money(100000));

    auto entry = engine_->getEntry(summary.id);
    ASSERT_TRUE(entry.has_value());
    ASSERT_EQ(entry->lines.size(), 2u);
    EXPECT_EQ(entry->lines[0].lineNumber, 1);
    EXPECT_EQ(entry->lines[1].lineNumber, 2);
    EXPECT_TRUE(entry->postedAt.has_value());
}

TEST_F(JournalPostingEngineTest, Unbalanced_RejectedAndNothingWritten) {
    auto request = cashSale(100000);
    request.lines[1].creditAmount = domain::Money(99950);

    EXPECT_THROW(engine_->createEntry(request), domain::ValidationException);

    EXPECT_EQ(entryCount(), 0);
    EXPECT_EQ(balance(CASH), domain::Money());
    EXPECT_EQ(balance(REVENUE), domain::Money());
    EXPECT_EQ(publisher_->publishCallCount(), 0);

    // Номер не израсходован
    EXPECT_EQ(engine_->createEntry(cashSale(500)).entryNumber, "JE-00001");
}

TEST_F(JournalPostingEngineTest, Draft_DoesNotTouchBalances) {
    auto summary = engine_->createEntry(cashSale(2500, false));

    EXPECT_EQ(summary.status, domain::JournalStatus::DRAFT);
    EXPECT_EQ(balance(CASH), domain::Money());
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

TEST_F(JournalPostingEngineTest, EntryDate_NormalizedToStartOfDay) {
    auto request = cashSale(100);
    request.entryDate = domain::Timestamp::fromString("2024-03-15T17:45:00");

    auto summary = engine_->createEntry(request);

    auto entry = engine_->getEntry(summary.id);
    EXPECT_EQ(entry->entryDate, domain::Timestamp::date(2024, 3, 15));
}

TEST_F(JournalPostingEngineTest, PublishesPostedEvent) {
    auto summary = engine_->createEntry(cashSale(100000));

    ASSERT_EQ(publisher_->publishCallCount(), 1);
    auto msg = publisher_->getPublishedMessages()[0];
    EXPECT_EQ(msg.routingKey, "journal.posted");

    auto json = nlohmann::json::parse(msg.message);
    EXPECT_EQ(json["entry_id"], summary.id);
    EXPECT_EQ(json["entry_number"], "JE-00001");
    EXPECT_EQ(json["source_type"], "MANUAL");
    EXPECT_EQ(json["status"], "POSTED");
    EXPECT_EQ(json["entry_date"], "2024-03-15");
    EXPECT_EQ(json["total_debit"], 100000);
    EXPECT_EQ(json["accounts"], nlohmann::json::array({CASH, REVENUE}));
}

TEST_F(JournalPostingEngineTest, PublishFailure_DoesNotUndoPosting) {
    publisher_->setFailing(true);

    auto summary = engine_->createEntry(cashSale(700));

    EXPECT_EQ(summary.status, domain::JournalStatus::POSTED);
    EXPECT_EQ(balance(CASH), domain::Money(700));
}

// ============================================================================
// POST
// ============================================================================

TEST_F(JournalPostingEngineTest, PostDraft_AppliesBalances) {
    auto draft = engine_->createEntry(cashSale(4000, false));

    auto posted = engine_->postEntry(draft.id, "approver");

    EXPECT_EQ(posted.status, domain::JournalStatus::POSTED);
    EXPECT_EQ(posted.entryNumber, draft.entryNumber);
    EXPECT_EQ(balance(CASH), domain::Money(4000));
    EXPECT_EQ(publisher_->publishCallCount(), 1);
}

TEST_F(JournalPostingEngineTest, PostTwice_AlreadyPosted) {
    auto draft = engine_->createEntry(cashSale(4000, false));
    engine_->postEntry(draft.id, "approver");

    try {
        engine_->postEntry(draft.id, "approver");
        FAIL() << "Expected StateException";
    } catch (const domain::StateException& e) {
        EXPECT_EQ(e.code(), domain::StateException::Code::ALREADY_POSTED);
    }
    EXPECT_EQ(balance(CASH), domain::Money(4000));
}

TEST_F(JournalPostingEngineTest, PostDraft_AccountDeactivatedMeanwhile_Rejected) {
    auto draft = engine_->createEntry(cashSale(4000, false));
    store_->setAccountActive(CASH, false);

    EXPECT_THROW(engine_->postEntry(draft.id, "approver"), domain::ValidationException);

    EXPECT_EQ(engine_->getEntry(draft.id)->status, domain::JournalStatus::DRAFT);
    EXPECT_EQ(balance(CASH), domain::Money());
}

TEST_F(JournalPostingEngineTest, PostUnknown_NotFound) {
    EXPECT_THROW(engine_->postEntry(404, "approver"), domain::EntryNotFoundException);
}

// ============================================================================
// REVERSE
// ============================================================================

TEST_F(JournalPostingEngineTest, Reverse_SwapsLinesAndRestoresBalances) {
    auto original = engine_->createEntry(cashSale(100000));

    auto reversal = engine_->reverseEntry(original.id, "wrong customer", "auditor");

    EXPECT_EQ(reversal.entryNumber, "RV-00001");
    EXPECT_EQ(reversal.status, domain::JournalStatus::POSTED);
    ASSERT_TRUE(reversal.reversalOfId.has_value());
    EXPECT_EQ(*reversal.reversalOfId, original.id);

    auto stored = engine_->getEntry(original.id);
    EXPECT_EQ(stored->status, domain::JournalStatus::REVERSED);
    ASSERT_TRUE(stored->reversedById.has_value());
    EXPECT_EQ(*stored->reversedById, reversal.id);
    EXPECT_EQ(stored->reversalReason, "wrong customer");
    EXPECT_EQ(stored->lines.size(), 2u);

    auto reversalEntry = engine_->getEntry(reversal.id);
    EXPECT_EQ(reversalEntry->sourceType, domain::SourceType::REVERSAL);
    EXPECT_EQ(reversalEntry->reference, "REV-INV-001");
    EXPECT_EQ(reversalEntry->lines[0].accountId, CASH);
    EXPECT_EQ(reversalEntry->lines[0].creditAmount, domain::Money(100000));
    EXPECT_EQ(reversalEntry->lines[1].accountId, REVENUE);
    EXPECT_EQ(reversalEntry->lines[1].debitAmount, domain::Money(100000));

    EXPECT_EQ(balance(CASH), domain::Money());
    EXPECT_EQ(balance(REVENUE), domain::Money());

    auto messages = publisher_->getPublishedMessages();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[1].routingKey, "journal.reversed");
    EXPECT_EQ(nlohmann::json::parse(messages[1].message)["reversal_of_id"], original.id);
}

TEST_F(JournalPostingEngineTest, ReverseOfReverse_RestoresOriginalEffect) {
    auto original = engine_->createEntry(cashSale(100000));
    auto first = engine_->reverseEntry(original.id, "mistake", "auditor");

    auto second = engine_->reverseEntry(first.id, "mistake was wrong", "auditor");

    EXPECT_EQ(second.entryNumber, "RV-00002");
    EXPECT_EQ(entryCount(), 3);
    EXPECT_EQ(engine_->getEntry(original.id)->status, domain::JournalStatus::REVERSED);
    EXPECT_EQ(engine_->getEntry(first.id)->status, domain::JournalStatus::REVERSED);
    EXPECT_EQ(engine_->getEntry(second.id)->status, domain::JournalStatus::POSTED);
    EXPECT_EQ(balance(CASH), domain::Money(100000));
    EXPECT_EQ(balance(REVENUE), domain::Money(100000));
}

TEST_F(JournalPostingEngineTest, ReverseTwice_AlreadyReversed) {
    auto original = engine_->createEntry(cashSale(100000));
    engine_->reverseEntry(original.id, "mistake", "auditor");

    try {
        engine_->reverseEntry(original.id, "again", "auditor");
        FAIL() << "Expected StateException";
    } catch (const domain::StateException& e) {
        EXPECT_EQ(e.code(), domain::StateException::Code::ALREADY_REVERSED);
    }
    EXPECT_EQ(entryCount(), 2);
}

TEST_F(JournalPostingEngineTest, ReverseDraft_NotPosted) {
    auto draft = engine_->createEntry(cashSale(100, false));

    try {
        engine_->reverseEntry(draft.id, "nope", "auditor");
        FAIL() << "Expected StateException";
    } catch (const domain::StateException& e) {
        EXPECT_EQ(e.code(), domain::StateException::Code::NOT_POSTED);
    }
}

TEST_F(JournalPostingEngineTest, ReverseUnknown_NotFound) {
    EXPECT_THROW(engine_->reverseEntry(404, "nope", "auditor"), domain::EntryNotFoundException);
}

TEST_F(JournalPostingEngineTest, Reverse_AllowedOnDeactivatedAccount) {
    auto original = engine_->createEntry(cashSale(3000));
    store_->setAccountActive(CASH, false);

    auto reversal = engine_->reverseEntry(original.id, "closing petty cash", "auditor");

    EXPECT_EQ(reversal.status, domain::JournalStatus::POSTED);
    EXPECT_EQ(balance(CASH), domain::Money());
}

// ============================================================================
// IDEMPOTENCY
// ============================================================================

TEST_F(JournalPostingEngineTest, SameSource_ReturnsExistingEntry) {
    auto first = engine_->createEntry(customerPayment(42, 5000));
    auto second = engine_->createEntry(customerPayment(42, 5000));

    EXPECT_FALSE(first.duplicate);
    EXPECT_TRUE(second.duplicate);
    EXPECT_EQ(second.id, first.id);
    EXPECT_EQ(second.entryNumber, "PY-00001");
    EXPECT_EQ(entryCount(), 1);
    EXPECT_EQ(balance(BANK), domain::Money(5000));
    EXPECT_EQ(publisher_->publishCallCount(), 1);
}

TEST_F(JournalPostingEngineTest, SameSource_AfterReversal_CanBeJournaledAgain) {
    auto first = engine_->createEntry(customerPayment(42, 5000));
    engine_->reverseEntry(first.id, "amount corrected", "clerk");

    auto corrected = engine_->createEntry(customerPayment(42, 4500));

    EXPECT_FALSE(corrected.duplicate);
    EXPECT_NE(corrected.id, first.id);
    EXPECT_EQ(balance(BANK), domain::Money(4500));
}

TEST_F(JournalPostingEngineTest, SameSource_HeldByDraft_AutoPostReturnsDraftUntouched) {
    auto request = customerPayment(42, 5000);
    request.autoPost = false;
    auto draft = engine_->createEntry(request);

    auto again = engine_->createEntry(customerPayment(42, 5000));

    EXPECT_TRUE(again.duplicate);
    EXPECT_EQ(again.id, draft.id);
    EXPECT_EQ(again.status, domain::JournalStatus::DRAFT);
    EXPECT_EQ(entryCount(), 1);
    EXPECT_EQ(balance(BANK), domain::Money());
    EXPECT_EQ(publisher_->publishCallCount(), 0);

    auto posted = engine_->postEntry(draft.id, "clerk");
    EXPECT_EQ(posted.status, domain::JournalStatus::POSTED);
    EXPECT_EQ(balance(BANK), domain::Money(5000));
}

TEST_F(JournalPostingEngineTest, ConcurrentSameSource_ExactlyOneEntry) {
    const int threads = 6;
    std::vector<std::thread> workers;
    std::mutex mutex;
    std::vector<domain::JournalEntrySummary> results;

    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&]() {
            auto summary = engine_->createEntry(customerPayment(42, 5000));
            std::lock_guard<std::mutex> lock(mutex);
            results.push_back(summary);
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    ASSERT_EQ(results.size(), static_cast<size_t>(threads));
    auto created = std::count_if(results.begin(), results.end(),
                                 [](const domain::JournalEntrySummary& s) { return !s.duplicate; });
    EXPECT_EQ(created, 1);
    for (const auto& s : results) {
        EXPECT_EQ(s.id, results[0].id);
    }

    EXPECT_EQ(queries_->getEntriesBySource(domain::SourceType::PAYMENT, 42).size(), 1u);
    EXPECT_EQ(balance(BANK), domain::Money(5000));
}

// ============================================================================
// CONCURRENCY / RETRY / ATOMICITY
// ============================================================================

TEST_F(JournalPostingEngineTest, ConcurrentCreates_ContiguousNumbersAndExactBalances) {
    const int threads = 8;
    const int perThread = 10;
    std::vector<std::thread> workers;
    std::mutex mutex;
    std::vector<std::string> numbers;

    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&]() {
            for (int i = 0; i < perThread; ++i) {
                auto summary = engine_->createEntry(cashSale(100));
                std::lock_guard<std::mutex> lock(mutex);
                numbers.push_back(summary.entryNumber);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::sort(numbers.begin(), numbers.end());
    ASSERT_EQ(numbers.size(), static_cast<size_t>(threads * perThread));
    for (int i = 0; i < threads * perThread; ++i) {
        EXPECT_EQ(numbers[i], SequenceGenerator::format("JE", i + 1));
    }
    EXPECT_EQ(balance(CASH), domain::Money(100 * threads * perThread));
    EXPECT_EQ(balance(REVENUE), domain::Money(100 * threads * perThread));
}

TEST_F(JournalPostingEngineTest, LockTimeout_Retried) {
    flaky_->failBegin(2);

    auto summary = engine_->createEntry(cashSale(100));

    EXPECT_EQ(summary.status, domain::JournalStatus::POSTED);
    EXPECT_EQ(flaky_->beginCalls(), 3);
}

TEST_F(JournalPostingEngineTest, LockTimeout_GivesUpAfterMaxAttempts) {
    flaky_->failBegin(10);

    try {
        engine_->createEntry(cashSale(100));
        FAIL() << "Expected ConcurrencyException";
    } catch (const domain::ConcurrencyException& e) {
        EXPECT_EQ(e.code(), domain::ConcurrencyException::Code::LOCK_TIMEOUT);
        EXPECT_TRUE(e.isRetryable());
    }
    EXPECT_EQ(flaky_->beginCalls(), 3);
    EXPECT_EQ(entryCount(), 0);
}

TEST_F(JournalPostingEngineTest, SequenceContention_RetriedWithoutPartialState) {
    flaky_->failSequence(1);

    auto summary = engine_->createEntry(cashSale(100));

    EXPECT_EQ(summary.entryNumber, "JE-00001");
    EXPECT_EQ(entryCount(), 1);
    EXPECT_EQ(balance(CASH), domain::Money(100));
}

TEST_F(JournalPostingEngineTest, CommitFailure_LeavesNoPartialState) {
    flaky_->failCommitOnce();

    EXPECT_THROW(engine_->createEntry(cashSale(100)), std::runtime_error);

    EXPECT_EQ(entryCount(), 0);
    EXPECT_EQ(balance(CASH), domain::Money());
    EXPECT_EQ(balance(REVENUE), domain::Money());
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

TEST_F(JournalPostingEngineTest, MaterializedBalance_MatchesRecomputation) {
    engine_->createEntry(cashSale(100000));
    auto second = engine_->createEntry(cashSale(2500));
    engine_->reverseEntry(second.id, "void", "auditor");
    engine_->createEntry(customerPayment(7, 30000));

    for (const auto& row : queries_->getAccountBalances(std::nullopt, false)) {
        EXPECT_EQ(balance(row.accountId), row.balance) << row.code;
    }
}
