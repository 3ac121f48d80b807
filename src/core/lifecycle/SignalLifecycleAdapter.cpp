/**
 * SignalLifecycleAdapter.cpp
 */

#include "SignalLifecycleAdapter.hpp"
#include "../Logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <pthread.h>
#include <time.h>

namespace lectern::core::lifecycle {

namespace {

sigset_t lifecycleSignals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGUSR1);
    sigaddset(&set, SIGUSR2);
    return set;
}

} // namespace

bool SignalLifecycleAdapter::blockSignals() {
    sigset_t set = lifecycleSignals();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        LOG_ERROR("Cannot block lifecycle signals: {}", std::strerror(rc));
        return false;
    }
    return true;
}

SignalLifecycleAdapter::SignalLifecycleAdapter() {
    blockSignals();
    
    m_events = std::make_unique<EventBus<LifecycleEvent>>();
    m_thread = std::thread([this] { waitLoop(); });
}

SignalLifecycleAdapter::~SignalLifecycleAdapter() {
    m_stop = true;
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

SubscriptionPtr SignalLifecycleAdapter::subscribe(Handler handler) {
    return m_events->subscribe([handler = std::move(handler)](const LifecycleEvent& event) {
        handler(event);
    });
}

void SignalLifecycleAdapter::unsubscribe(const SubscriptionPtr& subscription) {
    m_events->unsubscribe(subscription);
}

void SignalLifecycleAdapter::waitLoop() {
    sigset_t set = lifecycleSignals();
    
    // Short timeout so the destructor is never kept waiting for a signal
    timespec timeout{};
    timeout.tv_nsec = 200 * 1000 * 1000;
    
    while (!m_stop) {
        siginfo_t info{};
        int sig = sigtimedwait(&set, &info, &timeout);
        if (sig < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                LOG_ERROR("sigtimedwait failed: {}", std::strerror(errno));
                return;
            }
            continue;
        }
        
        if (sig == SIGUSR1) {
            LOG_INFO("Entered background");
            m_events->publish(LifecycleEvent::EnteredBackground);
        } else if (sig == SIGUSR2) {
            LOG_INFO("Became active");
            m_events->publish(LifecycleEvent::BecameActive);
        }
    }
}

} // namespace lectern::core::lifecycle
