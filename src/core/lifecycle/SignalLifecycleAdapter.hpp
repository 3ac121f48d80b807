#pragma once

/**
 * SignalLifecycleAdapter.hpp
 * 
 * Lifecycle transitions driven by POSIX signals:
 *   SIGUSR1 -> EnteredBackground
 *   SIGUSR2 -> BecameActive
 */

#include "LifecycleSignals.hpp"

#include <atomic>
#include <memory>
#include <thread>

namespace lectern::core::lifecycle {

/**
 * SignalLifecycleAdapter - sigwait based lifecycle source
 * 
 * Construct it on the main thread before any other thread is started: it
 * blocks SIGUSR1 and SIGUSR2 for the calling thread, and threads created
 * afterwards inherit that mask, so only the adapter's thread receives them.
 */
class SignalLifecycleAdapter : public LifecycleSignals {
public:
    SignalLifecycleAdapter();
    ~SignalLifecycleAdapter() override;
    
    SignalLifecycleAdapter(const SignalLifecycleAdapter&) = delete;
    SignalLifecycleAdapter& operator=(const SignalLifecycleAdapter&) = delete;
    
    SubscriptionPtr subscribe(Handler handler) override;
    void unsubscribe(const SubscriptionPtr& subscription) override;
    
    /**
     * Block SIGUSR1 and SIGUSR2 for the calling thread
     * @return false if the mask could not be changed
     */
    static bool blockSignals();

private:
    void waitLoop();

private:
    std::atomic<bool> m_stop{false};
    
    // Created after the mask is set so its dispatch thread inherits it
    std::unique_ptr<EventBus<LifecycleEvent>> m_events;
    std::thread m_thread;
};

} // namespace lectern::core::lifecycle
