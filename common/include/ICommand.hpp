#pragma once

/**
 * @file ICommand.hpp
 * @brief Интерфейс команды по паттерну Command
 */

/**
 * @brief Единица работы, которую можно поставить в очередь
 *
 * Воркер очереди вызывает execute() и сам решает, что делать
 * с исключением: повторить команду позже или отправить её в dead-letter.
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * @brief Выполнить команду
     * @throws std::runtime_error если команду невозможно выполнить
     */
    virtual void execute() = 0;

    /**
     * @brief Короткое имя команды для логов
     */
    virtual const char* name() const { return "command"; }
};
