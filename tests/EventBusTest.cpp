/**
 * EventBusTest.cpp
 */

#include "core/EventBus.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <stdexcept>
#include <vector>

namespace lectern::test {
namespace {

using core::EventBus;

TEST(EventBusTest, DeliversInPublishOrder) {
    EventBus<int> bus;
    std::mutex mutex;
    std::vector<int> received;

    auto subscription = bus.subscribe([&](const int& value) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(value);
    });

    for (int i = 0; i < 100; ++i) {
        bus.publish(i);
    }
    bus.waitIdle();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(received.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(received[i], i);
    }
}

TEST(EventBusTest, EverySubscriberReceivesEvents) {
    EventBus<int> bus;
    int first = 0;
    int second = 0;

    auto a = bus.subscribe([&](const int& value) { first += value; });
    auto b = bus.subscribe([&](const int& value) { second += value; });
    EXPECT_EQ(bus.getSubscriberCount(), 2u);

    bus.publish(3);
    bus.publish(4);
    bus.waitIdle();

    EXPECT_EQ(first, 7);
    EXPECT_EQ(second, 7);
}

TEST(EventBusTest, UnsubscribedHandlerIsNotCalled) {
    EventBus<int> bus;
    int calls = 0;

    auto subscription = bus.subscribe([&](const int&) { ++calls; });
    bus.publish(1);
    bus.waitIdle();

    bus.unsubscribe(subscription);
    EXPECT_FALSE(subscription->isActive());
    EXPECT_EQ(bus.getSubscriberCount(), 0u);

    bus.publish(2);
    bus.waitIdle();

    EXPECT_EQ(calls, 1);
}

TEST(EventBusTest, HandlerMayUnsubscribeItself) {
    EventBus<int> bus;
    int calls = 0;
    core::SubscriptionPtr subscription;

    subscription = bus.subscribe([&](const int&) {
        ++calls;
        bus.unsubscribe(subscription);
    });

    bus.publish(1);
    bus.publish(2);
    bus.waitIdle();

    EXPECT_EQ(calls, 1);
}

TEST(EventBusTest, ThrowingSubscriberDoesNotStopDelivery) {
    EventBus<int> bus;
    int delivered = 0;

    auto failing = bus.subscribe([](const int&) {
        throw std::runtime_error("subscriber failure");
    });
    auto counting = bus.subscribe([&](const int&) { ++delivered; });

    bus.publish(1);
    bus.publish(2);
    bus.waitIdle();

    EXPECT_EQ(delivered, 2);
}

TEST(EventBusTest, ForeignSubscriptionIsIgnored) {
    EventBus<int> first;
    EventBus<int> second;
    int firstCalls = 0;
    int secondCalls = 0;

    auto a = first.subscribe([&](const int&) { ++firstCalls; });
    auto b = second.subscribe([&](const int&) { ++secondCalls; });

    second.unsubscribe(a);
    EXPECT_TRUE(a->isActive());
    EXPECT_EQ(second.getSubscriberCount(), 1u);

    first.publish(1);
    second.publish(1);
    first.waitIdle();
    second.waitIdle();

    EXPECT_EQ(firstCalls, 1);
    EXPECT_EQ(secondCalls, 1);
}

} // namespace
} // namespace lectern::test
