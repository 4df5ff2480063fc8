#pragma once

#include "domain/Money.hpp"
#include "domain/enums/SourceType.hpp"
#include <string>
#include <map>
#include <chrono>
#include <cstdlib>
#include <stdexcept>

namespace ledger::settings {

/**
 * @brief Настройки журнала
 *
 * Читает из ENV:
 * - LEDGER_STORAGE (default: "postgres"; "memory" - хранилище в памяти)
 * - LEDGER_BALANCE_TOLERANCE_MINOR (default: 0) - допустимая разница дебета и кредита
 * - LEDGER_STRICT_LINE_SIDES (default: true) - строка либо дебетовая, либо кредитовая
 * - LEDGER_LOCK_TIMEOUT_MS (default: 2000)
 * - LEDGER_POST_MAX_ATTEMPTS (default: 3), LEDGER_POST_RETRY_BACKOFF_MS (default: 50)
 * - LEDGER_QUEUE_WORKERS (default: 2), LEDGER_QUEUE_MAX_ATTEMPTS (default: 5),
 *   LEDGER_QUEUE_RETRY_BACKOFF_MS (default: 200), LEDGER_QUEUE_TASK_DEADLINE_SECONDS (default: 60)
 * - LEDGER_RECONCILE_INTERVAL_SECONDS (default: 1800), LEDGER_RECONCILE_AUTO_HEAL (default: false)
 * - LEDGER_PREFIX_<SOURCE_TYPE>, например LEDGER_PREFIX_SALES=SJ
 */
class LedgerSettings {
public:
    LedgerSettings() {
        prefixes_ = {
            {domain::SourceType::MANUAL, "JE"},
            {domain::SourceType::SALES, "SJ"},
            {domain::SourceType::PURCHASE, "PJ"},
            {domain::SourceType::PAYMENT, "PY"},
            {domain::SourceType::CASH_BANK, "CB"},
            {domain::SourceType::CLOSING, "CL"},
            {domain::SourceType::ADJUSTMENT, "AJ"},
            {domain::SourceType::REVERSAL, "RV"}
        };

        if (const char* val = std::getenv("LEDGER_STORAGE")) {
            storage_ = val;
        }
        if (const char* val = std::getenv("LEDGER_BALANCE_TOLERANCE_MINOR")) {
            tolerance_ = domain::Money(std::stoll(val));
        }
        if (const char* val = std::getenv("LEDGER_STRICT_LINE_SIDES")) {
            strictLineSides_ = parseBool(val);
        }
        if (const char* val = std::getenv("LEDGER_LOCK_TIMEOUT_MS")) {
            lockTimeout_ = std::chrono::milliseconds(std::stoi(val));
        }
        if (const char* val = std::getenv("LEDGER_POST_MAX_ATTEMPTS")) {
            postMaxAttempts_ = std::stoi(val);
        }
        if (const char* val = std::getenv("LEDGER_POST_RETRY_BACKOFF_MS")) {
            postRetryBackoff_ = std::chrono::milliseconds(std::stoi(val));
        }
        if (const char* val = std::getenv("LEDGER_QUEUE_WORKERS")) {
            queueWorkers_ = std::stoi(val);
        }
        if (const char* val = std::getenv("LEDGER_QUEUE_MAX_ATTEMPTS")) {
            queueMaxAttempts_ = std::stoi(val);
        }
        if (const char* val = std::getenv("LEDGER_QUEUE_RETRY_BACKOFF_MS")) {
            queueRetryBackoff_ = std::chrono::milliseconds(std::stoi(val));
        }
        if (const char* val = std::getenv("LEDGER_QUEUE_TASK_DEADLINE_SECONDS")) {
            queueTaskDeadline_ = std::chrono::seconds(std::stoi(val));
        }
        if (const char* val = std::getenv("LEDGER_RECONCILE_INTERVAL_SECONDS")) {
            reconcileInterval_ = std::chrono::seconds(std::stoi(val));
        }
        if (const char* val = std::getenv("LEDGER_RECONCILE_AUTO_HEAL")) {
            reconcileAutoHeal_ = parseBool(val);
        }

        for (const auto type : domain::allSourceTypes()) {
            std::string envName = "LEDGER_PREFIX_" + domain::toString(type);
            if (const char* val = std::getenv(envName.c_str())) {
                setPrefix(type, val);
            }
        }
    }

    std::string getStorage() const { return storage_; }
    domain::Money getTolerance() const { return tolerance_; }
    bool isStrictLineSides() const { return strictLineSides_; }
    std::chrono::milliseconds getLockTimeout() const { return lockTimeout_; }
    int getPostMaxAttempts() const { return postMaxAttempts_; }
    std::chrono::milliseconds getPostRetryBackoff() const { return postRetryBackoff_; }
    int getQueueWorkers() const { return queueWorkers_; }
    int getQueueMaxAttempts() const { return queueMaxAttempts_; }
    std::chrono::milliseconds getQueueRetryBackoff() const { return queueRetryBackoff_; }
    std::chrono::seconds getQueueTaskDeadline() const { return queueTaskDeadline_; }
    std::chrono::seconds getReconcileInterval() const { return reconcileInterval_; }
    bool isReconcileAutoHeal() const { return reconcileAutoHeal_; }

    std::string getPrefix(domain::SourceType type) const {
        auto it = prefixes_.find(type);
        return it != prefixes_.end() ? it->second : "JE";
    }

    // Для тестов
    void setStorage(const std::string& storage) { storage_ = storage; }
    void setTolerance(domain::Money tolerance) { tolerance_ = tolerance; }
    void setStrictLineSides(bool strict) { strictLineSides_ = strict; }
    void setLockTimeout(std::chrono::milliseconds timeout) { lockTimeout_ = timeout; }
    void setPostMaxAttempts(int attempts) { postMaxAttempts_ = attempts; }
    void setPostRetryBackoff(std::chrono::milliseconds backoff) { postRetryBackoff_ = backoff; }
    void setQueueWorkers(int workers) { queueWorkers_ = workers; }
    void setQueueMaxAttempts(int attempts) { queueMaxAttempts_ = attempts; }
    void setQueueRetryBackoff(std::chrono::milliseconds backoff) { queueRetryBackoff_ = backoff; }
    void setQueueTaskDeadline(std::chrono::seconds deadline) { queueTaskDeadline_ = deadline; }
    void setReconcileInterval(std::chrono::seconds interval) { reconcileInterval_ = interval; }
    void setReconcileAutoHeal(bool autoHeal) { reconcileAutoHeal_ = autoHeal; }

    /**
     * @throws std::invalid_argument если префикс не из 1-10 символов [A-Z0-9]
     */
    void setPrefix(domain::SourceType type, const std::string& prefix) {
        if (prefix.empty() || prefix.size() > 10) {
            throw std::invalid_argument("Invalid journal prefix: '" + prefix + "'");
        }
        for (char c : prefix) {
            if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))) {
                throw std::invalid_argument("Invalid journal prefix: '" + prefix + "'");
            }
        }
        prefixes_[type] = prefix;
    }

private:
    std::string storage_ = "postgres";
    domain::Money tolerance_;
    bool strictLineSides_ = true;
    std::chrono::milliseconds lockTimeout_{2000};
    int postMaxAttempts_ = 3;
    std::chrono::milliseconds postRetryBackoff_{50};
    int queueWorkers_ = 2;
    int queueMaxAttempts_ = 5;
    std::chrono::milliseconds queueRetryBackoff_{200};
    std::chrono::seconds queueTaskDeadline_{60};
    std::chrono::seconds reconcileInterval_{1800};
    bool reconcileAutoHeal_ = false;
    std::map<domain::SourceType, std::string> prefixes_;

    static bool parseBool(const std::string& value) {
        return value == "1" || value == "true" || value == "TRUE" || value == "yes";
    }
};

} // namespace ledger::settings
