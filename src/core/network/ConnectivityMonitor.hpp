#pragma once

/**
 * ConnectivityMonitor.hpp
 * 
 * Network reachability and metered-connection state, with a push stream of
 * reachability transitions.
 */

#include "../EventBus.hpp"

#include <functional>

namespace lectern::core::network {

enum class Reachability {
    Reachable,
    Unreachable
};

class ConnectivityMonitor {
public:
    using Handler = std::function<void(Reachability)>;
    
    virtual ~ConnectivityMonitor() = default;
    
    virtual bool isInternetAvailable() const = 0;
    
    /**
     * true on mobile data or any other connection billed by volume
     */
    virtual bool isMeteredConnection() const = 0;
    
    /**
     * Subscribe to reachability transitions (repeats are not published)
     */
    virtual SubscriptionPtr subscribe(Handler handler) = 0;
    
    virtual void unsubscribe(const SubscriptionPtr& subscription) = 0;
};

} // namespace lectern::core::network
