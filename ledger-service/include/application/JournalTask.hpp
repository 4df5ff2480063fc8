#pragma once

#include <ICommand.hpp>
#include <chrono>
#include <functional>
#include <string>

namespace ledger::application {

/**
 * @brief Отложенная проводка документа
 *
 * Хранит исходное событие (payload), чтобы при окончательной неудаче
 * его можно было положить в dead-letter и переиграть вручную.
 */
class JournalTask : public ICommand {
public:
    using Clock = std::chrono::steady_clock;
    using Action = std::function<void()>;

    JournalTask(std::string name, std::string payload, Action action)
        : name_(std::move(name))
        , payload_(std::move(payload))
        , action_(std::move(action))
    {}

    void execute() override {
        ++attempts_;
        action_();
    }

    const char* name() const override { return name_.c_str(); }

    const std::string& payload() const { return payload_; }

    int attempts() const { return attempts_; }

    bool hasDeadline() const { return deadline_ != Clock::time_point{}; }
    Clock::time_point deadline() const { return deadline_; }
    void setDeadline(Clock::time_point deadline) { deadline_ = deadline; }

    bool isExpired(Clock::time_point now = Clock::now()) const {
        return hasDeadline() && now > deadline_;
    }

private:
    std::string name_;
    std::string payload_;
    Action action_;
    int attempts_ = 0;
    Clock::time_point deadline_{};
};

} // namespace ledger::application
