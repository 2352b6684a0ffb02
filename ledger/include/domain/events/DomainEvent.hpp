#pragma once

#include "domain/Timestamp.hpp"
#include <string>
#include <memory>

namespace ledger::domain {

/**
 * @brief Базовый класс для всех доменных событий
 *
 * Публикуется через IEventBus после фиксации перехода проводки,
 * чтобы модули бюджета и отчётности узнавали об изменениях сальдо.
 */
struct DomainEvent {
    std::string eventId;        ///< UUID события
    std::string eventType;      ///< Тип события (journal.posted, journal.reversed)
    std::string companyId;
    Timestamp timestamp;        ///< Время создания события

    DomainEvent() : timestamp(Timestamp::now()) {}

    explicit DomainEvent(const std::string& type)
        : eventType(type), timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;

    /**
     * @brief Клонировать событие
     */
    virtual std::unique_ptr<DomainEvent> clone() const = 0;
};

} // namespace ledger::domain
