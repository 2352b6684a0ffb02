#pragma once

#include "domain/events/DomainEvent.hpp"
#include <string>
#include <functional>
#include <memory>

namespace ledger::ports::output {

/**
 * @brief Callback для обработчиков событий
 */
using EventHandler = std::function<void(const domain::DomainEvent&)>;

/**
 * @brief Интерфейс событийной шины
 *
 * Output Port, через который модули бюджета, движения денежных средств
 * и отчётности узнают о проведении, сторнировании и аннулировании проводок.
 */
class IEventBus {
public:
    virtual ~IEventBus() = default;

    /**
     * @brief Опубликовать событие всем подписчикам его типа
     */
    virtual void publish(const domain::DomainEvent& event) = 0;

    /**
     * @brief Подписаться на тип события
     *
     * @param eventType Тип события (например, "journal.posted")
     * @param handler Функция-обработчик
     *
     * @note Один eventType может иметь несколько handlers
     */
    virtual void subscribe(const std::string& eventType, EventHandler handler) = 0;

    /**
     * @brief Отписать все handlers данного типа
     */
    virtual void unsubscribe(const std::string& eventType) = 0;

    virtual bool hasSubscribers(const std::string& eventType) const = 0;
};

} // namespace ledger::ports::output
