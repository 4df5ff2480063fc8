#include "ThreadSafeQueue.hpp"

ThreadSafeQueue::ThreadSafeQueue() = default;

ThreadSafeQueue::~ThreadSafeQueue() {
    shutdown();
}

bool ThreadSafeQueue::push(std::shared_ptr<ICommand> command) {
    return pushAt(std::move(command), Clock::now());
}

bool ThreadSafeQueue::pushAt(std::shared_ptr<ICommand> command, Clock::time_point readyAt) {
    if (!command) return false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) return false;
        queue_.push(Item{readyAt, nextSeq_++, std::move(command)});
    }

    // Новая команда может оказаться раньше той, которую ждёт воркер
    condVar_.notify_all();
    return true;
}

std::shared_ptr<ICommand> ThreadSafeQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!shutdown_) {
        if (queue_.empty()) {
            condVar_.wait(lock);
            continue;
        }

        auto readyAt = queue_.top().readyAt;
        if (readyAt <= Clock::now()) {
            auto command = queue_.top().command;
            queue_.pop();
            return command;
        }

        condVar_.wait_until(lock, readyAt);
    }

    return nullptr;
}

void ThreadSafeQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    condVar_.notify_all();
}

std::vector<std::shared_ptr<ICommand>> ThreadSafeQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::shared_ptr<ICommand>> rest;
    rest.reserve(queue_.size());
    while (!queue_.empty()) {
        rest.push_back(queue_.top().command);
        queue_.pop();
    }
    return rest;
}

bool ThreadSafeQueue::isShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

bool ThreadSafeQueue::isEmpty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

size_t ThreadSafeQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}
