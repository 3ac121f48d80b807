#pragma once

/**
 * EventBus.hpp
 * 
 * Typed publish/subscribe channel with ordered, asynchronous delivery.
 * Events are delivered on a single dispatch thread in the order they were
 * published, so a publisher may post while holding its own lock and the
 * subscribers may call back into it.
 */

#include "Logger.hpp"
#include "ThreadPool.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace lectern::core {

/**
 * Event subscription handle
 */
class Subscription {
public:
    explicit Subscription(uint64_t id)
        : m_id(id), m_active(true) {}
    
    uint64_t getId() const { return m_id; }
    bool isActive() const { return m_active; }
    void cancel() { m_active = false; }

private:
    uint64_t m_id;
    std::atomic<bool> m_active;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

/**
 * EventBus - Thread-safe typed publish/subscribe channel
 * 
 * Features:
 * - Multiple subscribers per bus
 * - Per-subscriber delivery in publish order
 * - Unsubscribe waits for an in-flight delivery to finish
 */
template<typename Event>
class EventBus {
public:
    using Handler = std::function<void(const Event&)>;
    
    EventBus() : m_dispatcher(1) {}
    
    ~EventBus() = default;
    
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    
    /**
     * Subscribe to the bus
     * @param handler Callback invoked on the dispatch thread
     * @return Subscription handle for unsubscribing
     */
    SubscriptionPtr subscribe(Handler handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        auto subscription = std::make_shared<Subscription>(m_nextId++);
        m_subscribers.push_back({subscription, std::move(handler)});
        
        return subscription;
    }
    
    /**
     * Unsubscribe; no callback for this handle runs after this returns.
     * A handle issued by another bus is ignored.
     * @param subscription Subscription handle
     */
    void unsubscribe(const SubscriptionPtr& subscription) {
        if (!subscription) return;
        
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = std::remove_if(m_subscribers.begin(), m_subscribers.end(),
                [&](const SubscriberEntry& entry) {
                    return entry.subscription == subscription;
                });
            if (it == m_subscribers.end()) {
                return;
            }
            m_subscribers.erase(it, m_subscribers.end());
        }
        
        subscription->cancel();
        
        // Recursive so a handler may unsubscribe itself
        std::lock_guard<std::recursive_mutex> delivery(m_deliveryMutex);
    }
    
    /**
     * Queue an event for delivery to every current subscriber
     * @param event Event value
     */
    void publish(Event event) {
        m_dispatcher.post([this, event = std::move(event)]() {
            deliver(event);
        });
    }
    
    /**
     * Block until every published event has been delivered
     */
    void waitIdle() {
        m_dispatcher.waitAll();
    }
    
    size_t getSubscriberCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_subscribers.size();
    }

private:
    struct SubscriberEntry {
        SubscriptionPtr subscription;
        Handler handler;
    };
    
    void deliver(const Event& event) {
        std::vector<SubscriberEntry> snapshot;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            snapshot = m_subscribers;
        }
        
        std::lock_guard<std::recursive_mutex> delivery(m_deliveryMutex);
        for (const auto& entry : snapshot) {
            if (!entry.subscription->isActive()) {
                continue;
            }
            try {
                entry.handler(event);
            } catch (const std::exception& e) {
                LOG_ERROR("Event subscriber {} threw: {}", entry.subscription->getId(), e.what());
            }
        }
    }

private:
    mutable std::mutex m_mutex;
    std::recursive_mutex m_deliveryMutex;
    std::vector<SubscriberEntry> m_subscribers;
    std::atomic<uint64_t> m_nextId{0};
    
    // Declared last: destroyed first, draining queued deliveries
    ThreadPool m_dispatcher;
};

} // namespace lectern::core
