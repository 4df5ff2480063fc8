#pragma once

#include "ports/input/IBalanceHealthService.hpp"
#include "settings/LedgerSettings.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <iostream>

namespace ledger::application {

/**
 * @brief Фоновая сверка остатков по расписанию
 *
 * Раз в reconcileInterval запускает checkHealth(), при включённом
 * autoHeal пересчитывает расходящиеся счета.
 */
class BalanceReconciliationJob {
public:
    BalanceReconciliationJob(
        std::shared_ptr<ports::input::IBalanceHealthService> healthService,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : healthService_(std::move(healthService))
      , settings_(std::move(settings))
      , running_(false)
      , runCount_(0)
    {}

    ~BalanceReconciliationJob() {
        stop();
    }

    BalanceReconciliationJob(const BalanceReconciliationJob&) = delete;
    BalanceReconciliationJob& operator=(const BalanceReconciliationJob&) = delete;

    void start() {
        if (running_.exchange(true)) return;

        thread_ = std::thread([this]() {
            std::cout << "[BalanceReconciliationJob] Started, interval="
                      << settings_->getReconcileInterval().count() << "s" << std::endl;
            while (running_) {
                runOnce();

                std::unique_lock<std::mutex> lock(mutex_);
                wakeUp_.wait_for(lock, settings_->getReconcileInterval(), [this]() { return !running_; });
            }
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false)) {
                return;
            }
        }
        wakeUp_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
        std::cout << "[BalanceReconciliationJob] Stopped" << std::endl;
    }

    bool isRunning() const { return running_; }

    uint64_t runCount() const { return runCount_; }

    /**
     * @brief Один проход сверки (и для тестов)
     */
    domain::BalanceHealthReport runOnce() {
        ++runCount_;
        try {
            auto report = settings_->isReconcileAutoHeal() ? healthService_->autoHeal()
                                                           : healthService_->checkHealth();
            if (!report.isHealthy()) {
                std::cerr << "[BalanceReconciliationJob] Ledger drift: " << report.drifts.size()
                          << " accounts, healed " << report.healedAccounts << std::endl;
            }
            return report;
        } catch (const std::exception& e) {
            std::cerr << "[BalanceReconciliationJob] Run failed: " << e.what() << std::endl;
            domain::BalanceHealthReport failed;
            failed.equationHolds = false;
            return failed;
        }
    }

private:
    std::shared_ptr<ports::input::IBalanceHealthService> healthService_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> runCount_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wakeUp_;
};

} // namespace ledger::application
