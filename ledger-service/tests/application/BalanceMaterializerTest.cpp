/**
 * @file BalanceMaterializerTest.cpp
 * @brief Unit tests for BalanceMaterializer
 */

#include <gtest/gtest.h>
#include "application/BalanceMaterializer.hpp"
#include "adapters/secondary/memory/InMemoryLedgerStore.hpp"

using namespace ledger;
using namespace ledger::application;

class BalanceMaterializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::LedgerSettings>();
        store_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>(settings_);
        store_->seedDefaultChart();
    }

    // Каталог хранилища берёт ту же блокировку, что и сессия: читать до begin()
    domain::Account account(int64_t id) {
        return *store_->findById(id);
    }

    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store_;
    BalanceMaterializer materializer_;
};

// ============================================================================
// DELTA RULE
// ============================================================================

TEST_F(BalanceMaterializerTest, DebitNormalAccount_GrowsOnDebit) {
    auto delta = BalanceMaterializer::computeDelta(domain::NormalBalance::DEBIT,
                                                   domain::Money(1000), domain::Money(300));
    EXPECT_EQ(delta, domain::Money(700));
}

TEST_F(BalanceMaterializerTest, CreditNormalAccount_GrowsOnCredit) {
    auto delta = BalanceMaterializer::computeDelta(domain::NormalBalance::CREDIT,
                                                   domain::Money(1000), domain::Money(300));
    EXPECT_EQ(delta, domain::Money(-700));
}

TEST_F(BalanceMaterializerTest, ApplyPosting_UpdatesInsideSession) {
    auto revenue = account(12);
    auto session = store_->begin();
    auto balance = materializer_.applyPosting(*session, revenue, domain::Money(), domain::Money(5000));
    EXPECT_EQ(balance, domain::Money(5000));
    session->commit();

    EXPECT_EQ(account(12).currentBalance, domain::Money(5000));
}

TEST_F(BalanceMaterializerTest, RolledBackPosting_LeavesBalance) {
    auto cash = account(1);
    {
        auto session = store_->begin();
        materializer_.applyPosting(*session, cash, domain::Money(5000), domain::Money());
        session->rollback();
    }

    EXPECT_EQ(account(1).currentBalance, domain::Money());
}

// ============================================================================
// APPLY ENTRY
// ============================================================================

TEST_F(BalanceMaterializerTest, ApplyEntry_AggregatesPerAccount) {
    domain::JournalEntry entry;
    domain::JournalLine l1; l1.accountId = 1; l1.debitAmount = domain::Money(600);
    domain::JournalLine l2; l2.accountId = 1; l2.debitAmount = domain::Money(400);
    domain::JournalLine l3; l3.accountId = 12; l3.creditAmount = domain::Money(1000);
    entry.lines = {l1, l2, l3};

    std::map<int64_t, domain::Account> accounts{{1, account(1)}, {12, account(12)}};

    auto session = store_->begin();
    auto touched = materializer_.applyEntry(*session, entry, accounts);
    session->commit();

    EXPECT_EQ(touched, (std::vector<int64_t>{1, 12}));
    EXPECT_EQ(account(1).currentBalance, domain::Money(1000));
    EXPECT_EQ(account(12).currentBalance, domain::Money(1000));
}

TEST_F(BalanceMaterializerTest, ApplyEntry_MissingAccount_Throws) {
    domain::JournalEntry entry;
    domain::JournalLine l1; l1.accountId = 1; l1.debitAmount = domain::Money(100);
    entry.lines = {l1};

    auto session = store_->begin();
    EXPECT_THROW(materializer_.applyEntry(*session, entry, {}), domain::IntegrityException);
}

// ============================================================================
// RECOMPUTE
// ============================================================================

TEST_F(BalanceMaterializerTest, Recompute_RestoresCorruptedBalance) {
    store_->corruptBalance(1, domain::Money(123));

    auto session = store_->begin();
    auto balance = materializer_.recompute(*session, 1);
    session->commit();

    EXPECT_EQ(balance, domain::Money());
    EXPECT_EQ(account(1).currentBalance, domain::Money());
}

TEST_F(BalanceMaterializerTest, Recompute_UnknownAccount_Throws) {
    auto session = store_->begin();
    EXPECT_THROW(materializer_.recompute(*session, 999), domain::IntegrityException);
}
