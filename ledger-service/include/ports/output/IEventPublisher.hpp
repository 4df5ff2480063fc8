#pragma once

#include <string>

namespace ledger::ports::output {

/**
 * @brief Интерфейс публикации событий
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (journal.posted, journal.reversed)
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace ledger::ports::output
