#pragma once

#include "ICommand.hpp"
#include <queue>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <memory>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Потокобезопасная очередь команд с отложенным выполнением
 * @details
 * Команда может быть поставлена с моментом готовности (readyAt).
 * pop() блокируется до тех пор, пока не наступит время самой ранней
 * готовой команды. Команды с одинаковым readyAt выдаются в порядке push().
 */
class ThreadSafeQueue {
public:
    using Clock = std::chrono::steady_clock;

private:
    struct Item {
        Clock::time_point readyAt;
        uint64_t seq;
        std::shared_ptr<ICommand> command;
    };

    struct Later {
        bool operator()(const Item& a, const Item& b) const {
            if (a.readyAt != b.readyAt) return a.readyAt > b.readyAt;
            return a.seq > b.seq;
        }
    };

    std::priority_queue<Item, std::vector<Item>, Later> queue_;  ///< Очередь по времени готовности
    mutable std::mutex mutex_;                                   ///< Мьютекс для синхронизации
    std::condition_variable condVar_;                            ///< Условная переменная для ожидания
    uint64_t nextSeq_ = 0;                                       ///< Счётчик для FIFO при равном readyAt
    bool shutdown_ = false;                                      ///< Флаг завершения работы очереди

public:
    ThreadSafeQueue();
    ~ThreadSafeQueue();

    /**
     * @brief Добавить команду, готовую к немедленному выполнению
     * @return false, если команда пустая или очередь закрыта
     */
    bool push(std::shared_ptr<ICommand> command);

    /**
     * @brief Добавить команду, которая станет доступна не раньше readyAt
     * @return false, если команда пустая или очередь закрыта
     */
    bool pushAt(std::shared_ptr<ICommand> command, Clock::time_point readyAt);

    /**
     * @brief Извлечь готовую команду (блокирующий вызов)
     * @return команда, либо nullptr, если очередь закрыта
     */
    std::shared_ptr<ICommand> pop();

    /**
     * @brief Закрыть очередь и пробудить все ожидающие потоки
     *
     * Команды, оставшиеся в очереди, не выдаются через pop();
     * их можно забрать через drain().
     */
    void shutdown();

    /**
     * @brief Забрать все оставшиеся команды независимо от readyAt
     */
    std::vector<std::shared_ptr<ICommand>> drain();

    bool isShutdown() const;

    bool isEmpty() const;

    size_t size() const;
};
