#pragma once

/**
 * ProbeConnectivityMonitor.hpp
 * 
 * Reachability from periodic HTTP HEAD probes.
 */

#include "ConnectivityMonitor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace lectern::core::network {

/**
 * ProbeConnectivityMonitor - Polling reachability monitor
 * 
 * Any HTTP answer from the probe URL counts as reachable. The metered flag
 * comes from the "network.metered" setting, since the daemon has no
 * portable way to ask the OS.
 */
class ProbeConnectivityMonitor : public ConnectivityMonitor {
public:
    /**
     * Constructor - runs the first probe synchronously, then polls
     * @param probeUrl URL answered by a reachable network
     * @param interval Time between probes
     */
    ProbeConnectivityMonitor(std::string probeUrl, std::chrono::milliseconds interval);
    
    ~ProbeConnectivityMonitor() override;
    
    ProbeConnectivityMonitor(const ProbeConnectivityMonitor&) = delete;
    ProbeConnectivityMonitor& operator=(const ProbeConnectivityMonitor&) = delete;
    
    bool isInternetAvailable() const override { return m_available; }
    bool isMeteredConnection() const override;
    
    SubscriptionPtr subscribe(Handler handler) override;
    void unsubscribe(const SubscriptionPtr& subscription) override;

private:
    bool probe() const;
    void pollLoop();

private:
    std::string m_probeUrl;
    std::chrono::milliseconds m_interval;
    
    std::atomic<bool> m_available{false};
    
    std::mutex m_mutex;
    std::condition_variable m_wakeup;
    bool m_stop{false};
    
    EventBus<Reachability> m_events;
    std::thread m_thread;
};

} // namespace lectern::core::network
