#pragma once

#include "ports/output/IDeadLetterSink.hpp"
#include <mutex>
#include <vector>
#include <iostream>

namespace ledger::adapters::secondary {

/**
 * @brief Dead-letter в памяти (тесты, LEDGER_STORAGE=memory)
 */
class InMemoryDeadLetterSink : public ports::output::IDeadLetterSink {
public:
    void put(const domain::DeadLetter& letter) override {
        std::lock_guard<std::mutex> lock(mutex_);
        domain::DeadLetter stored = letter;
        stored.id = static_cast<int64_t>(letters_.size()) + 1;
        letters_.push_back(stored);
    }

    std::vector<domain::DeadLetter> list(size_t limit) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::DeadLetter> result;
        for (auto it = letters_.rbegin(); it != letters_.rend() && result.size() < limit; ++it) {
            result.push_back(*it);
        }
        return result;
    }

    size_t count() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return letters_.size();
    }

private:
    std::mutex mutex_;
    std::vector<domain::DeadLetter> letters_;
};

} // namespace ledger::adapters::secondary
