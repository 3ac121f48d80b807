#pragma once

/**
 * LifecycleSignals.hpp
 * 
 * Foreground/background transitions of the host application.
 */

#include "../EventBus.hpp"

#include <functional>

namespace lectern::core::lifecycle {

enum class LifecycleEvent {
    EnteredBackground,
    BecameActive
};

class LifecycleSignals {
public:
    using Handler = std::function<void(LifecycleEvent)>;
    
    virtual ~LifecycleSignals() = default;
    
    virtual SubscriptionPtr subscribe(Handler handler) = 0;
    virtual void unsubscribe(const SubscriptionPtr& subscription) = 0;
};

} // namespace lectern::core::lifecycle
