/**
 * ProbeConnectivityMonitor.cpp
 */

#include "ProbeConnectivityMonitor.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"

#include <cpr/cpr.h>

namespace lectern::core::network {

ProbeConnectivityMonitor::ProbeConnectivityMonitor(std::string probeUrl, std::chrono::milliseconds interval)
    : m_probeUrl(std::move(probeUrl))
    , m_interval(interval) {
    
    m_available = probe();
    LOG_INFO("Network {} (probe {})", m_available ? "reachable" : "unreachable", m_probeUrl);
    
    m_thread = std::thread([this] { pollLoop(); });
}

ProbeConnectivityMonitor::~ProbeConnectivityMonitor() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
    }
    m_wakeup.notify_all();
    
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool ProbeConnectivityMonitor::isMeteredConnection() const {
    return Config::instance().get<bool>("network.metered", false);
}

SubscriptionPtr ProbeConnectivityMonitor::subscribe(Handler handler) {
    return m_events.subscribe([handler = std::move(handler)](const Reachability& state) {
        handler(state);
    });
}

void ProbeConnectivityMonitor::unsubscribe(const SubscriptionPtr& subscription) {
    m_events.unsubscribe(subscription);
}

bool ProbeConnectivityMonitor::probe() const {
    cpr::Response response = cpr::Head(
        cpr::Url{m_probeUrl},
        cpr::Timeout{std::chrono::milliseconds(3000)}
    );
    
    if (response.status_code == 0) {
        LOG_TRACE("Probe failed: {}", response.error.message);
        return false;
    }
    return true;
}

void ProbeConnectivityMonitor::pollLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_wakeup.wait_for(lock, m_interval, [this] { return m_stop; })) {
                return;
            }
        }
        
        bool available = probe();
        if (available == m_available.exchange(available)) {
            continue;
        }
        
        LOG_INFO("Network became {}", available ? "reachable" : "unreachable");
        m_events.publish(available ? Reachability::Reachable : Reachability::Unreachable);
    }
}

} // namespace lectern::core::network
