#pragma once

#include "application/JournalTask.hpp"
#include "ports/output/IDeadLetterSink.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/LedgerErrors.hpp"
#include <ThreadSafeQueue.hpp>
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <iostream>

namespace ledger::application {

/**
 * @brief Очередь асинхронных проводок с повторами и dead-letter
 *
 * Доставка at-least-once: повтор безопасен, потому что движок
 * проверяет (sourceType, sourceId) и не создаёт вторую проводку.
 *
 * - ValidationException / IntegrityException / StateException -> сразу dead-letter;
 * - прочие ошибки -> повтор с экспоненциальной задержкой, пока не
 *   исчерпаны попытки и не истёк дедлайн задачи;
 * - при остановке невыполненные задачи уходят в dead-letter.
 */
class JournalPostingQueue {
public:
    JournalPostingQueue(
        std::shared_ptr<ports::output::IDeadLetterSink> deadLetters,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : deadLetters_(std::move(deadLetters))
      , settings_(std::move(settings))
      , running_(false)
      , inFlight_(0)
      , completed_(0)
      , retried_(0)
      , deadLettered_(0)
    {}

    ~JournalPostingQueue() {
        stop();
    }

    JournalPostingQueue(const JournalPostingQueue&) = delete;
    JournalPostingQueue& operator=(const JournalPostingQueue&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        int workers = std::max(1, settings_->getQueueWorkers());
        for (int i = 0; i < workers; ++i) {
            workers_.emplace_back([this]() { workerLoop(); });
        }
        std::cout << "[JournalPostingQueue] Started " << workers << " workers" << std::endl;
    }

    void stop() {
        if (!running_.exchange(false)) return;

        queue_.shutdown();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();

        auto rest = queue_.drain();
        for (auto& command : rest) {
            deadLetter(std::static_pointer_cast<JournalTask>(command), "queue stopped before delivery");
        }
        std::cout << "[JournalPostingQueue] Stopped, undelivered: " << rest.size() << std::endl;
    }

    /**
     * @brief Поставить задачу; без дедлайна получает дедлайн из настроек
     * @return false, если очередь остановлена (задача сразу уходит в dead-letter)
     */
    bool submit(std::shared_ptr<JournalTask> task) {
        if (!task->hasDeadline()) {
            task->setDeadline(JournalTask::Clock::now() + settings_->getQueueTaskDeadline());
        }

        ++inFlight_;
        if (!running_ || !queue_.push(task)) {
            deadLetter(task, "queue is not running");
            return false;
        }
        return true;
    }

    bool submit(const std::string& name, const std::string& payload, JournalTask::Action action) {
        return submit(std::make_shared<JournalTask>(name, payload, std::move(action)));
    }

    /**
     * @brief Дождаться, пока все поставленные задачи завершатся (успехом или dead-letter)
     * @return false по таймауту
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(idleMutex_);
        return idle_.wait_for(lock, timeout, [this]() { return inFlight_.load() == 0; });
    }

    bool isRunning() const { return running_; }
    uint64_t completedCount() const { return completed_; }
    uint64_t retriedCount() const { return retried_; }
    uint64_t deadLetteredCount() const { return deadLettered_; }

private:
    std::shared_ptr<ports::output::IDeadLetterSink> deadLetters_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    ThreadSafeQueue queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_;
    std::atomic<int> inFlight_;
    std::atomic<uint64_t> completed_;
    std::atomic<uint64_t> retried_;
    std::atomic<uint64_t> deadLettered_;
    std::mutex idleMutex_;
    std::condition_variable idle_;

    void workerLoop() {
        while (auto command = queue_.pop()) {
            handle(std::static_pointer_cast<JournalTask>(command));
        }
    }

    void handle(const std::shared_ptr<JournalTask>& task) {
        if (task->isExpired()) {
            deadLetter(task, "deadline exceeded before attempt " + std::to_string(task->attempts() + 1));
            return;
        }

        try {
            task->execute();
            ++completed_;
            finish();
        } catch (const domain::LedgerException& e) {
            if (e.isRetryable()) {
                retryOrDeadLetter(task, e.what());
            } else {
                deadLetter(task, e.what());
            }
        } catch (const std::exception& e) {
            // Обрыв соединения с БД и т.п. - считаем временным
            retryOrDeadLetter(task, e.what());
        }
    }

    void retryOrDeadLetter(const std::shared_ptr<JournalTask>& task, const std::string& error) {
        if (task->attempts() >= settings_->getQueueMaxAttempts()) {
            deadLetter(task, error + " (attempts exhausted)");
            return;
        }

        auto delay = settings_->getQueueRetryBackoff() * (1LL << std::min(task->attempts() - 1, 16));
        auto readyAt = JournalTask::Clock::now() + delay;
        if (task->hasDeadline() && readyAt > task->deadline()) {
            deadLetter(task, error + " (deadline exceeded)");
            return;
        }

        std::cerr << "[JournalPostingQueue] " << task->name() << " attempt " << task->attempts()
                  << " failed: " << error << ", retry in "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(delay).count() << "ms" << std::endl;

        if (!queue_.pushAt(task, readyAt)) {
            deadLetter(task, error + " (queue stopped)");
            return;
        }
        ++retried_;
    }

    void deadLetter(const std::shared_ptr<JournalTask>& task, const std::string& error) {
        domain::DeadLetter letter;
        letter.taskName = task->name();
        letter.payload = task->payload();
        letter.lastError = error;
        letter.attempts = task->attempts();
        letter.failedAt = domain::Timestamp::now();

        std::cerr << "[JournalPostingQueue] Dead-letter " << letter.taskName
                  << " after " << letter.attempts << " attempts: " << error << std::endl;

        try {
            deadLetters_->put(letter);
        } catch (const std::exception& e) {
            std::cerr << "[JournalPostingQueue] LOST TASK " << letter.taskName
                      << " payload=" << letter.payload << ": dead-letter write failed: " << e.what() << std::endl;
        }

        ++deadLettered_;
        finish();
    }

    void finish() {
        if (--inFlight_ == 0) {
            std::lock_guard<std::mutex> lock(idleMutex_);
            idle_.notify_all();
        }
    }
};

} // namespace ledger::application
