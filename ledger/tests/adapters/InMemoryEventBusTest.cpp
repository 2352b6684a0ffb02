/**
 * @file InMemoryEventBusTest.cpp
 * @brief Тесты для InMemoryEventBus
 *
 * Проверяет:
 * - Доставку события всем подписчикам типа
 * - Изоляцию разных типов событий
 * - Продолжение доставки при ошибке одного обработчика
 */

#include <gtest/gtest.h>
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "domain/events/JournalPostedEvent.hpp"
#include "domain/events/JournalVoidedEvent.hpp"
#include <stdexcept>

using namespace ledger::adapters::secondary;
using namespace ledger::domain;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class InMemoryEventBusTest : public ::testing::Test {
protected:
    void SetUp() override {
        eventBus_ = std::make_unique<InMemoryEventBus>();
    }

    void TearDown() override {
        eventBus_->clear();
        eventBus_.reset();
    }

    JournalPostedEvent createPostedEvent(const std::string& number) {
        JournalPostedEvent event;
        event.companyId = "company-1";
        event.journalNumber = number;
        return event;
    }

    std::unique_ptr<InMemoryEventBus> eventBus_;
};

// ============================================================================
// SUBSCRIBE / PUBLISH
// ============================================================================

TEST_F(InMemoryEventBusTest, Publish_DeliversToSubscriber) {
    std::string received;
    eventBus_->subscribe("journal.posted", [&](const DomainEvent& event) {
        received = static_cast<const JournalPostedEvent&>(event).journalNumber;
    });

    eventBus_->publish(createPostedEvent("JE-2025-000001"));

    EXPECT_EQ(received, "JE-2025-000001");
}

TEST_F(InMemoryEventBusTest, Publish_DeliversToAllSubscribersOfType) {
    int calls = 0;
    eventBus_->subscribe("journal.posted", [&](const DomainEvent&) { ++calls; });
    eventBus_->subscribe("journal.posted", [&](const DomainEvent&) { ++calls; });

    eventBus_->publish(createPostedEvent("JE-2025-000001"));

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(eventBus_->subscriberCount("journal.posted"), 2u);
}

TEST_F(InMemoryEventBusTest, Publish_OtherTypeNotDelivered) {
    int postedCalls = 0;
    eventBus_->subscribe("journal.posted", [&](const DomainEvent&) { ++postedCalls; });

    JournalVoidedEvent voided;
    voided.reason = "duplicate";
    eventBus_->publish(voided);

    EXPECT_EQ(postedCalls, 0);
}

TEST_F(InMemoryEventBusTest, Publish_WithoutSubscribers_DoesNothing) {
    EXPECT_FALSE(eventBus_->hasSubscribers("journal.posted"));
    EXPECT_NO_THROW(eventBus_->publish(createPostedEvent("JE-2025-000001")));
}

TEST_F(InMemoryEventBusTest, Publish_FailingHandler_OthersStillCalled) {
    int calls = 0;
    eventBus_->subscribe("journal.posted", [](const DomainEvent&) {
        throw std::runtime_error("budget module unavailable");
    });
    eventBus_->subscribe("journal.posted", [&](const DomainEvent&) { ++calls; });

    EXPECT_NO_THROW(eventBus_->publish(createPostedEvent("JE-2025-000001")));
    EXPECT_EQ(calls, 1);
}

TEST_F(InMemoryEventBusTest, Unsubscribe_RemovesAllHandlersOfType) {
    int calls = 0;
    eventBus_->subscribe("journal.posted", [&](const DomainEvent&) { ++calls; });
    eventBus_->subscribe("journal.voided", [&](const DomainEvent&) { ++calls; });

    eventBus_->unsubscribe("journal.posted");
    eventBus_->publish(createPostedEvent("JE-2025-000001"));

    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(eventBus_->hasSubscribers("journal.posted"));
    EXPECT_TRUE(eventBus_->hasSubscribers("journal.voided"));
}

TEST_F(InMemoryEventBusTest, Handler_MaySubscribeDuringPublish) {
    // Обработчики вызываются вне блокировки
    eventBus_->subscribe("journal.posted", [this](const DomainEvent&) {
        eventBus_->subscribe("journal.reversed", [](const DomainEvent&) {});
    });

    eventBus_->publish(createPostedEvent("JE-2025-000001"));

    EXPECT_TRUE(eventBus_->hasSubscribers("journal.reversed"));
}
