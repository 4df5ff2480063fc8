/**
 * @file SourceEventListenerTest.cpp
 * @brief Tests for SourceEventListener: event -> posting queue -> journal
 */

#include <gtest/gtest.h>
#include "adapters/primary/SourceEventListener.hpp"
#include "adapters/secondary/memory/InMemoryLedgerStore.hpp"
#include "adapters/secondary/memory/InMemoryDeadLetterSink.hpp"
#include "application/JournalPostingEngine.hpp"
#include "application/LedgerQueryService.hpp"
#include "../mocks/MockEventConsumer.hpp"
#include "../mocks/MockEventPublisher.hpp"

using namespace ledger;
using namespace ledger::application;
using namespace ledger::application::sources;
using ledger::adapters::primary::SourceEventListener;

class SourceEventListenerTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::LedgerSettings>();
        settings_->setQueueWorkers(2);
        settings_->setQueueRetryBackoff(std::chrono::milliseconds(5));

        store_ = std::make_shared<adapters::secondary::InMemoryLedgerStore>(settings_);
        store_->seedDefaultChart();
        deadLetters_ = std::make_shared<adapters::secondary::InMemoryDeadLetterSink>();
        publisher_ = std::make_shared<tests::MockEventPublisher>();
        consumer_ = std::make_shared<tests::MockEventConsumer>();

        auto engine = std::make_shared<JournalPostingEngine>(store_, store_, publisher_, settings_);
        queries_ = std::make_shared<LedgerQueryService>(store_);
        queue_ = std::make_shared<JournalPostingQueue>(deadLetters_, settings_);

        listener_ = std::make_unique<SourceEventListener>(
            consumer_, queue_,
            std::make_shared<SalesJournalAdapter>(engine, queries_, store_),
            std::make_shared<PurchaseJournalAdapter>(engine, queries_, store_),
            std::make_shared<PaymentJournalAdapter>(engine, queries_, store_));

        queue_->start();
    }

    void TearDown() override {
        queue_->stop();
    }

    void drain() {
        ASSERT_TRUE(queue_->waitUntilIdle(std::chrono::seconds(5)));
    }

    domain::Money balance(int64_t accountId) {
        return store_->findById(accountId)->currentBalance;
    }

    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store_;
    std::shared_ptr<adapters::secondary::InMemoryDeadLetterSink> deadLetters_;
    std::shared_ptr<tests::MockEventPublisher> publisher_;
    std::shared_ptr<tests::MockEventConsumer> consumer_;
    std::shared_ptr<LedgerQueryService> queries_;
    std::shared_ptr<JournalPostingQueue> queue_;
    std::unique_ptr<SourceEventListener> listener_;
};

// ============================================================================
// SUBSCRIPTION
// ============================================================================

TEST_F(SourceEventListenerTest, SubscribesToSourceDocuments) {
    EXPECT_TRUE(consumer_->isSubscribed("sales.invoiced"));
    EXPECT_TRUE(consumer_->isSubscribed("purchase.approved"));
    EXPECT_TRUE(consumer_->isSubscribed("payment.recorded"));
    EXPECT_FALSE(consumer_->isSubscribed("journal.posted"));
}

TEST_F(SourceEventListenerTest, UnknownRoutingKey_Ignored) {
    EXPECT_FALSE(listener_->handleEvent("inventory.adjusted", "{}"));
    EXPECT_EQ(listener_->receivedCount(), 1u);
    drain();
    EXPECT_EQ(deadLetters_->count(), 0u);
}

// ============================================================================
// DELIVERY
// ============================================================================

TEST_F(SourceEventListenerTest, SaleEvent_Journaled) {
    consumer_->deliver("sales.invoiced", R"({
        "id": 501, "invoice_number": "INV-0501", "customer_name": "PT Maju",
        "date": "2024-06-03", "payment_method": "CREDIT",
        "subtotal": "1000.00", "vat": "110.00", "total": "1110.00"
    })");
    drain();

    auto entries = queries_->getEntriesBySource(domain::SourceType::SALES, 501);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].status, domain::JournalStatus::POSTED);
    EXPECT_EQ(entries[0].entryDate, domain::Timestamp::date(2024, 6, 3));
    EXPECT_EQ(balance(3), domain::Money(111000));
    EXPECT_EQ(publisher_->publishCallCount(), 1);
}

TEST_F(SourceEventListenerTest, PurchaseEvent_Journaled) {
    consumer_->deliver("purchase.approved", R"({
        "id": 88, "code": "PO-0088", "vendor_name": "CV Sumber", "date": "2024-07-01",
        "items": [
            {"description": "Paper", "amount": 40000},
            {"description": "Consulting", "amount": 60000, "expense_account_id": 14}
        ],
        "vat": 11000, "pph23": 1200, "total": 111000
    })");
    drain();

    EXPECT_EQ(queries_->getEntriesBySource(domain::SourceType::PURCHASE, 88).size(), 1u);
    EXPECT_EQ(balance(7), domain::Money(109800));
    EXPECT_EQ(balance(10), domain::Money(1200));
}

TEST_F(SourceEventListenerTest, RedeliveredPayment_JournaledOnce) {
    const std::string event = R"({"id": 42, "code": "RCV-0042", "amount": 50000, "method": "BANK"})";

    consumer_->deliver("payment.recorded", event);
    consumer_->deliver("payment.recorded", event);
    drain();

    EXPECT_EQ(queries_->getEntriesBySource(domain::SourceType::PAYMENT, 42).size(), 1u);
    EXPECT_EQ(balance(2), domain::Money(50000));
    EXPECT_EQ(queue_->completedCount(), 2u);
}

// ============================================================================
// FAILURES
// ============================================================================

TEST_F(SourceEventListenerTest, MalformedJson_DeadLettered) {
    consumer_->deliver("payment.recorded", "{not json");
    drain();

    auto letters = deadLetters_->list(10);
    ASSERT_EQ(letters.size(), 1u);
    EXPECT_EQ(letters[0].taskName, "payment.recorded");
    EXPECT_EQ(letters[0].payload, "{not json");
    EXPECT_EQ(letters[0].attempts, 1);
    EXPECT_NE(letters[0].lastError.find("malformed event JSON"), std::string::npos);
}

TEST_F(SourceEventListenerTest, MissingId_DeadLettered) {
    consumer_->deliver("sales.invoiced", R"({"invoice_number": "INV-1", "total": 100})");
    drain();

    ASSERT_EQ(deadLetters_->count(), 1u);
    EXPECT_NE(deadLetters_->list(1)[0].lastError.find("field 'id' is required"), std::string::npos);
}

TEST_F(SourceEventListenerTest, UnbalancedDocument_DeadLetteredAndNothingWritten) {
    consumer_->deliver("sales.invoiced", R"({
        "id": 9, "invoice_number": "INV-9", "subtotal": 100000, "vat": 0, "total": 99950
    })");
    drain();

    EXPECT_EQ(deadLetters_->count(), 1u);
    EXPECT_TRUE(queries_->getEntriesBySource(domain::SourceType::SALES, 9).empty());
    EXPECT_EQ(balance(3), domain::Money());
}

// ============================================================================
// PARSING
// ============================================================================

TEST_F(SourceEventListenerTest, ParseMoney_AcceptedForms) {
    auto json = nlohmann::json::parse(R"({"a": 12345, "b": "123.45", "c": 123.45, "d": null})");

    EXPECT_EQ(SourceEventListener::parseMoney(json, "a"), domain::Money(12345));
    EXPECT_EQ(SourceEventListener::parseMoney(json, "b"), domain::Money(12345));
    EXPECT_EQ(SourceEventListener::parseMoney(json, "c"), domain::Money(12345));
    EXPECT_EQ(SourceEventListener::parseMoney(json, "d"), domain::Money());
    EXPECT_EQ(SourceEventListener::parseMoney(json, "missing"), domain::Money());
}

TEST_F(SourceEventListenerTest, ParseMoney_OutOfRangeRejected) {
    auto json = nlohmann::json::parse(R"({
        "long": "99999999999999999999",
        "edge": "92233720368547758.08",
        "max": "92233720368547758.07",
        "huge": 1e300,
        "unsigned": 18446744073709551615
    })");

    EXPECT_THROW(SourceEventListener::parseMoney(json, "long"), std::invalid_argument);
    EXPECT_THROW(SourceEventListener::parseMoney(json, "edge"), std::invalid_argument);
    EXPECT_EQ(SourceEventListener::parseMoney(json, "max"), domain::Money(domain::Money::MAX_MINOR));
    EXPECT_THROW(SourceEventListener::parseMoney(json, "huge"), std::invalid_argument);
    EXPECT_THROW(SourceEventListener::parseMoney(json, "unsigned"), std::invalid_argument);
}

TEST_F(SourceEventListenerTest, OverflowingAmount_DeadLetteredAndNothingWritten) {
    consumer_->deliver("payment.recorded",
                       R"({"id": 43, "code": "RCV-0043", "amount": "99999999999999999999"})");
    drain();

    ASSERT_EQ(deadLetters_->count(), 1u);
    EXPECT_EQ(deadLetters_->list(1)[0].attempts, 1);
    EXPECT_NE(deadLetters_->list(1)[0].lastError.find("out of range"), std::string::npos);
    EXPECT_TRUE(queries_->getEntriesBySource(domain::SourceType::PAYMENT, 43, true).empty());
    EXPECT_EQ(balance(2), domain::Money());
}

TEST_F(SourceEventListenerTest, ParsePayment_DefaultsAndAliases) {
    auto payment = SourceEventListener::parsePayment(nlohmann::json::parse(
        R"({"id": 7, "code": "PAY-7", "kind": "PAYABLE", "amount": "10.00"})"));

    EXPECT_EQ(payment.kind, domain::PaymentKind::VENDOR);
    EXPECT_EQ(payment.method, domain::PaymentMethod::BANK);
    EXPECT_EQ(payment.amount, domain::Money(1000));
}

TEST_F(SourceEventListenerTest, ParseSale_UnknownEnum_ValidationError) {
    auto json = nlohmann::json::parse(R"({"id": 1, "payment_method": "BARTER"})");

    EXPECT_THROW(SourceEventListener::parseSale(json), domain::ValidationException);
}
