/**
 * @file LedgerQueryServiceTest.cpp
 * @brief Unit tests for LedgerQueryService
 */

#include <gtest/gtest.h>
#include "application/LedgerQueryService.hpp"
#include "application/JournalPostingEngine.hpp"
#include "adapters/secondary/memory/InMemoryLedgerStore.hpp"
#include <algorithm>

using namespace ledger;
using namespace ledger::application;

class LedgerQueryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::LedgerSettings>();
        store_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>(settings_);
        store_->seedDefaultChart();
        engine_ = std::make_shared<JournalPostingEngine>(store_, store_, nullptr, settings_);
        queries_ = std::make_shared<LedgerQueryService>(store_);
    }

    domain::JournalEntrySummary post(domain::Timestamp date, int64_t debitAccount, int64_t creditAccount,
                                     int64_t minor, bool autoPost = true,
                                     const std::string& reference = "REF") {
        domain::JournalEntryRequest request;
        request.reference = reference;
        request.entryDate = date;
        request.description = "Test entry";
        request.lines = {
            domain::JournalLineRequest::debit(debitAccount, domain::Money(minor)),
            domain::JournalLineRequest::credit(creditAccount, domain::Money(minor))
        };
        request.autoPost = autoPost;
        return engine_->createEntry(request);
    }

    static domain::AccountBalance find(const std::vector<domain::AccountBalance>& rows, int64_t id) {
        auto it = std::find_if(rows.begin(), rows.end(),
                               [id](const domain::AccountBalance& row) { return row.accountId == id; });
        return it != rows.end() ? *it : domain::AccountBalance{};
    }

    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store_;
    std::shared_ptr<JournalPostingEngine> engine_;
    std::shared_ptr<LedgerQueryService> queries_;
};

// ============================================================================
// BALANCES
// ============================================================================

TEST_F(LedgerQueryServiceTest, Balances_AsOfDateIsInclusive) {
    post(domain::Timestamp::date(2024, 1, 10), 1, 12, 10000);
    post(domain::Timestamp::date(2024, 1, 20), 1, 12, 5000);

    auto rows = queries_->getAccountBalances(domain::Timestamp::date(2024, 1, 10));

    EXPECT_EQ(find(rows, 1).balance, domain::Money(10000));
    EXPECT_EQ(find(rows, 12).balance, domain::Money(10000));
    EXPECT_EQ(find(rows, 12).creditTotal, domain::Money(10000));
    EXPECT_EQ(find(rows, 12).code, "4101");
}

TEST_F(LedgerQueryServiceTest, Balances_NoDateMeansEverything) {
    post(domain::Timestamp::date(2024, 1, 10), 1, 12, 10000);
    post(domain::Timestamp::date(2024, 1, 20), 1, 12, 5000);

    auto rows = queries_->getAccountBalances(std::nullopt);

    EXPECT_EQ(find(rows, 1).balance, domain::Money(15000));
    EXPECT_EQ(rows.size(), 14u);
}

TEST_F(LedgerQueryServiceTest, Balances_DraftsOnlyWhenRequested) {
    post(domain::Timestamp::date(2024, 1, 10), 1, 12, 10000);
    post(domain::Timestamp::date(2024, 1, 11), 1, 12, 700, false);

    EXPECT_EQ(find(queries_->getAccountBalances(std::nullopt, false), 1).balance, domain::Money(10000));
    EXPECT_EQ(find(queries_->getAccountBalances(std::nullopt, true), 1).balance, domain::Money(10700));
}

TEST_F(LedgerQueryServiceTest, Balances_ReversedEntryStillCountsWithItsReversal) {
    auto original = post(domain::Timestamp::date(2024, 1, 10), 1, 12, 10000);
    engine_->reverseEntry(original.id, "void", "auditor");

    auto row = find(queries_->getAccountBalances(std::nullopt), 1);

    EXPECT_EQ(row.debitTotal, domain::Money(10000));
    EXPECT_EQ(row.creditTotal, domain::Money(10000));
    EXPECT_EQ(row.balance, domain::Money());
}

TEST_F(LedgerQueryServiceTest, Balances_CreditNormalAccountSigned) {
    post(domain::Timestamp::date(2024, 1, 10), 14, 7, 2500);

    auto rows = queries_->getAccountBalances(std::nullopt);

    EXPECT_EQ(find(rows, 14).balance, domain::Money(2500));
    EXPECT_EQ(find(rows, 7).balance, domain::Money(2500));
}

// ============================================================================
// ENTRIES BY SOURCE
// ============================================================================

TEST_F(LedgerQueryServiceTest, EntriesBySource_IncludesReversedHistory) {
    domain::JournalEntryRequest request;
    request.sourceType = domain::SourceType::SALES;
    request.sourceId = 77;
    request.entryDate = domain::Timestamp::date(2024, 2, 1);
    request.description = "Invoice 77";
    request.lines = {
        domain::JournalLineRequest::debit(3, domain::Money(1000)),
        domain::JournalLineRequest::credit(12, domain::Money(1000))
    };
    request.autoPost = true;

    auto first = engine_->createEntry(request);
    engine_->reverseEntry(first.id, "re-issued", "clerk");
    engine_->createEntry(request);

    auto entries = queries_->getEntriesBySource(domain::SourceType::SALES, 77);

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_TRUE(queries_->getEntriesBySource(domain::SourceType::SALES, 78).empty());
}

TEST_F(LedgerQueryServiceTest, EntriesBySource_DraftsOnlyWhenRequested) {
    domain::JournalEntryRequest request;
    request.sourceType = domain::SourceType::PAYMENT;
    request.sourceId = 42;
    request.entryDate = domain::Timestamp::date(2024, 2, 5);
    request.description = "Receipt 42, not yet posted";
    request.lines = {
        domain::JournalLineRequest::debit(2, domain::Money(5000)),
        domain::JournalLineRequest::credit(3, domain::Money(5000))
    };
    request.autoPost = false;

    auto draft = engine_->createEntry(request);

    EXPECT_TRUE(queries_->getEntriesBySource(domain::SourceType::PAYMENT, 42).empty());

    auto withDrafts = queries_->getEntriesBySource(domain::SourceType::PAYMENT, 42, true);
    ASSERT_EQ(withDrafts.size(), 1u);
    EXPECT_EQ(withDrafts[0].id, draft.id);
    EXPECT_EQ(withDrafts[0].status, domain::JournalStatus::DRAFT);

    engine_->postEntry(draft.id, "clerk");
    EXPECT_EQ(queries_->getEntriesBySource(domain::SourceType::PAYMENT, 42).size(), 1u);
}

// ============================================================================
// ACCOUNT LEDGER
// ============================================================================

TEST_F(LedgerQueryServiceTest, Ledger_OpeningRunningAndClosing) {
    post(domain::Timestamp::date(2024, 1, 5), 1, 12, 10000);
    post(domain::Timestamp::date(2024, 2, 1), 1, 12, 3000);
    post(domain::Timestamp::date(2024, 2, 15), 14, 1, 1000);
    post(domain::Timestamp::date(2024, 3, 1), 1, 12, 999);

    auto ledger = queries_->getLedgerForAccount(1, domain::Timestamp::date(2024, 2, 1),
                                                domain::Timestamp::date(2024, 2, 29));

    EXPECT_EQ(ledger.code, "1101");
    EXPECT_EQ(ledger.openingBalance, domain::Money(10000));
    ASSERT_EQ(ledger.lines.size(), 2u);
    EXPECT_EQ(ledger.lines[0].runningBalance, domain::Money(13000));
    EXPECT_EQ(ledger.lines[1].runningBalance, domain::Money(12000));
    EXPECT_EQ(ledger.totalDebit, domain::Money(3000));
    EXPECT_EQ(ledger.totalCredit, domain::Money(1000));
    EXPECT_EQ(ledger.closingBalance, domain::Money(12000));
}

TEST_F(LedgerQueryServiceTest, Ledger_NoRangeStartsFromZero) {
    post(domain::Timestamp::date(2024, 1, 5), 1, 12, 10000);
    post(domain::Timestamp::date(2024, 1, 6), 14, 1, 4000);

    auto ledger = queries_->getLedgerForAccount(1, std::nullopt, std::nullopt);

    EXPECT_EQ(ledger.openingBalance, domain::Money());
    ASSERT_EQ(ledger.lines.size(), 2u);
    EXPECT_EQ(ledger.lines[0].activity.debitAmount, domain::Money(10000));
    EXPECT_EQ(ledger.closingBalance, domain::Money(6000));
}

TEST_F(LedgerQueryServiceTest, Ledger_UnknownAccount_Throws) {
    EXPECT_THROW(queries_->getLedgerForAccount(999, std::nullopt, std::nullopt), domain::IntegrityException);
}

// ============================================================================
// LIST
// ============================================================================

TEST_F(LedgerQueryServiceTest, List_NewestFirstWithPaging) {
    for (int day = 1; day <= 5; ++day) {
        post(domain::Timestamp::date(2024, 4, day), 1, 12, 100 * day, true, "BATCH-" + std::to_string(day));
    }

    domain::JournalFilter filter;
    filter.limit = 2;
    filter.page = 2;
    auto page = queries_->listEntries(filter);

    EXPECT_EQ(page.total, 5);
    EXPECT_EQ(page.totalPages(), 3);
    ASSERT_EQ(page.entries.size(), 2u);
    EXPECT_EQ(page.entries[0].reference, "BATCH-3");
    EXPECT_EQ(page.entries[1].reference, "BATCH-2");
}

TEST_F(LedgerQueryServiceTest, List_FiltersByStatusDateAndReference) {
    post(domain::Timestamp::date(2024, 4, 1), 1, 12, 100, true, "INV-001");
    post(domain::Timestamp::date(2024, 4, 2), 1, 12, 100, false, "INV-002");
    post(domain::Timestamp::date(2024, 4, 3), 1, 12, 100, true, "BILL-003");

    domain::JournalFilter posted;
    posted.status = domain::JournalStatus::POSTED;
    EXPECT_EQ(queries_->listEntries(posted).total, 2);

    domain::JournalFilter byReference;
    byReference.reference = "INV";
    EXPECT_EQ(queries_->listEntries(byReference).total, 2);

    domain::JournalFilter byDate;
    byDate.dateFrom = domain::Timestamp::date(2024, 4, 2);
    byDate.dateTo = domain::Timestamp::date(2024, 4, 2);
    auto page = queries_->listEntries(byDate);
    ASSERT_EQ(page.total, 1);
    EXPECT_EQ(page.entries[0].reference, "INV-002");
}
