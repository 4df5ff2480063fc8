/**
 * @file JournalPostingQueueTest.cpp
 * @brief Unit tests for JournalPostingQueue
 */

#include <gtest/gtest.h>
#include "application/JournalPostingQueue.hpp"
#include "adapters/secondary/memory/InMemoryDeadLetterSink.hpp"
#include <atomic>

using namespace ledger;
using namespace ledger::application;

class JournalPostingQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::LedgerSettings>();
        settings_->setQueueWorkers(2);
        settings_->setQueueMaxAttempts(3);
        settings_->setQueueRetryBackoff(std::chrono::milliseconds(5));
        deadLetters_ = std::make_shared<adapters::secondary::InMemoryDeadLetterSink>();
        queue_ = std::make_unique<JournalPostingQueue>(deadLetters_, settings_);
    }

    void TearDown() override {
        queue_->stop();
    }

    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<adapters::secondary::InMemoryDeadLetterSink> deadLetters_;
    std::unique_ptr<JournalPostingQueue> queue_;
};

// ============================================================================
// DELIVERY
// ============================================================================

TEST_F(JournalPostingQueueTest, Success_CompletesOnce) {
    std::atomic<int> calls{0};
    queue_->start();

    ASSERT_TRUE(queue_->submit("sales.invoiced", "{}", [&]() { ++calls; }));

    ASSERT_TRUE(queue_->waitUntilIdle(std::chrono::seconds(5)));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(queue_->completedCount(), 1u);
    EXPECT_EQ(queue_->retriedCount(), 0u);
    EXPECT_EQ(deadLetters_->count(), 0u);
}

TEST_F(JournalPostingQueueTest, ManyTasks_AllComplete) {
    std::atomic<int> calls{0};
    queue_->start();

    for (int i = 0; i < 50; ++i) {
        queue_->submit("payment.recorded", std::to_string(i), [&]() { ++calls; });
    }

    ASSERT_TRUE(queue_->waitUntilIdle(std::chrono::seconds(5)));
    EXPECT_EQ(calls, 50);
    EXPECT_EQ(queue_->completedCount(), 50u);
}

// ============================================================================
// RETRY
// ============================================================================

TEST_F(JournalPostingQueueTest, ConcurrencyFailure_RetriedUntilSuccess) {
    std::atomic<int> calls{0};
    queue_->start();

    queue_->submit("payment.recorded", "{\"code\":\"PAY-1\"}", [&]() {
        if (++calls < 3) {
            throw domain::ConcurrencyException(domain::ConcurrencyException::Code::LOCK_TIMEOUT, "busy");
        }
    });

    ASSERT_TRUE(queue_->waitUntilIdle(std::chrono::seconds(5)));
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(queue_->retriedCount(), 2u);
    EXPECT_EQ(queue_->completedCount(), 1u);
    EXPECT_EQ(deadLetters_->count(), 0u);
}

TEST_F(JournalPostingQueueTest, TransientFailure_AttemptsExhausted_DeadLettered) {
    std::atomic<int> calls{0};
    queue_->start();

    queue_->submit("purchase.approved", "{\"code\":\"PO-9\"}", [&]() {
        ++calls;
        throw std::runtime_error("connection reset");
    });

    ASSERT_TRUE(queue_->waitUntilIdle(std::chrono::seconds(5)));
    EXPECT_EQ(calls, 3);

    auto letters = deadLetters_->list(10);
    ASSERT_EQ(letters.size(), 1u);
    EXPECT_EQ(letters[0].taskName, "purchase.approved");
    EXPECT_EQ(letters[0].payload, "{\"code\":\"PO-9\"}");
    EXPECT_EQ(letters[0].attempts, 3);
    EXPECT_NE(letters[0].lastError.find("attempts exhausted"), std::string::npos);
}

TEST_F(JournalPostingQueueTest, ValidationFailure_DeadLetteredWithoutRetry) {
    std::atomic<int> calls{0};
    queue_->start();

    queue_->submit("sales.invoiced", "{\"id\":5}", [&]() {
        ++calls;
        throw domain::ValidationException("unbalanced: debit 1000.00 != credit 999.50");
    });

    ASSERT_TRUE(queue_->waitUntilIdle(std::chrono::seconds(5)));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(queue_->retriedCount(), 0u);
    EXPECT_EQ(queue_->deadLetteredCount(), 1u);

    auto letters = deadLetters_->list(10);
    ASSERT_EQ(letters.size(), 1u);
    EXPECT_NE(letters[0].lastError.find("unbalanced"), std::string::npos);
}

TEST_F(JournalPostingQueueTest, StateFailure_DeadLettered) {
    queue_->start();

    queue_->submit("journal.reverse", "{}", []() {
        throw domain::StateException(domain::StateException::Code::ALREADY_REVERSED, "already reversed");
    });

    ASSERT_TRUE(queue_->waitUntilIdle(std::chrono::seconds(5)));
    EXPECT_EQ(deadLetters_->count(), 1u);
}

// ============================================================================
// DEADLINE
// ============================================================================

TEST_F(JournalPostingQueueTest, ExpiredTask_NotExecuted) {
    std::atomic<int> calls{0};
    queue_->start();

    auto task = std::make_shared<JournalTask>("sales.invoiced", "{}", [&]() { ++calls; });
    task->setDeadline(JournalTask::Clock::now() - std::chrono::seconds(1));
    queue_->submit(task);

    ASSERT_TRUE(queue_->waitUntilIdle(std::chrono::seconds(5)));
    EXPECT_EQ(calls, 0);
    ASSERT_EQ(deadLetters_->count(), 1u);
    EXPECT_NE(deadLetters_->list(1)[0].lastError.find("deadline exceeded"), std::string::npos);
}

TEST_F(JournalPostingQueueTest, RetryBeyondDeadline_DeadLettered) {
    settings_->setQueueRetryBackoff(std::chrono::milliseconds(5000));
    settings_->setQueueTaskDeadline(std::chrono::seconds(1));
    queue_->start();

    queue_->submit("payment.recorded", "{}", []() {
        throw domain::ConcurrencyException(domain::ConcurrencyException::Code::BALANCE_CONTENTION, "busy");
    });

    ASSERT_TRUE(queue_->waitUntilIdle(std::chrono::seconds(5)));
    EXPECT_EQ(queue_->retriedCount(), 0u);
    ASSERT_EQ(deadLetters_->count(), 1u);
    EXPECT_NE(deadLetters_->list(1)[0].lastError.find("deadline exceeded"), std::string::npos);
}

// ============================================================================
// LIFECYCLE
// ============================================================================

TEST_F(JournalPostingQueueTest, Submit_WhileStopped_DeadLettered) {
    std::atomic<int> calls{0};

    EXPECT_FALSE(queue_->submit("sales.invoiced", "{\"id\":1}", [&]() { ++calls; }));

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(deadLetters_->count(), 1u);
    EXPECT_TRUE(queue_->waitUntilIdle(std::chrono::milliseconds(10)));
}

TEST_F(JournalPostingQueueTest, Stop_PendingRetryGoesToDeadLetter) {
    settings_->setQueueRetryBackoff(std::chrono::milliseconds(10000));
    settings_->setQueueTaskDeadline(std::chrono::seconds(60));
    std::atomic<int> calls{0};
    queue_->start();

    queue_->submit("payment.recorded", "{}", [&]() {
        ++calls;
        throw std::runtime_error("database unavailable");
    });
    for (int i = 0; i < 500 && queue_->retriedCount() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    ASSERT_EQ(queue_->retriedCount(), 1u);

    queue_->stop();

    EXPECT_FALSE(queue_->isRunning());
    EXPECT_EQ(calls, 1);
    ASSERT_EQ(deadLetters_->count(), 1u);
    EXPECT_EQ(deadLetters_->list(1)[0].lastError, "queue stopped before delivery");
    EXPECT_TRUE(queue_->waitUntilIdle(std::chrono::milliseconds(10)));
}
