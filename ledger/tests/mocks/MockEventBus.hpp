#pragma once

#include "ports/output/IEventBus.hpp"
#include <gmock/gmock.h>

namespace ledger::tests {

/**
 * @brief gmock реализация IEventBus
 */
class MockEventBus : public ports::output::IEventBus {
public:
    MOCK_METHOD(void, publish, (const domain::DomainEvent& event), (override));
    MOCK_METHOD(void, subscribe, (const std::string& eventType, ports::output::EventHandler handler), (override));
    MOCK_METHOD(void, unsubscribe, (const std::string& eventType), (override));
    MOCK_METHOD(bool, hasSubscribers, (const std::string& eventType), (const, override));
};

} // namespace ledger::tests
