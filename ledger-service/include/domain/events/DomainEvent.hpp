#pragma once

#include "domain/Timestamp.hpp"
#include <string>
#include <utility>

namespace ledger::domain {

/**
 * @brief Конверт события для брокера
 *
 * routingKey совпадает с ключом маршрутизации в exchange,
 * aggregateId: идентификатор транзакции, к которой относится событие.
 */
struct DomainEvent {
    std::string eventId;
    std::string routingKey;
    std::string aggregateId;
    Timestamp occurredAt;

    DomainEvent(std::string key, std::string aggregate)
        : eventId("evt-" + aggregate)
        , routingKey(std::move(key))
        , aggregateId(std::move(aggregate))
        , occurredAt(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    virtual std::string toJson() const = 0;
};

} // namespace ledger::domain
