#pragma once

/**
 * Application.hpp
 *
 * Core application class that manages the lifecycle of the downloader.
 * Loads the configuration, sets up logging and wires the download manager
 * to its store, transfer client and signal sources.
 */

#include <memory>
#include <atomic>
#include <string>
#include <functional>
#include <vector>
#include <mutex>

namespace lectern::core::downloader {
class DownloadManager;
class JsonTaskStore;
class CprTransferClient;
}
namespace lectern::core::network { class ProbeConnectivityMonitor; }
namespace lectern::core::lifecycle { class SignalLifecycleAdapter; }

namespace lectern::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Error
};

/**
 * Main application class
 *
 * Owns every subsystem. Construct on the main thread before any other
 * thread is started (see SignalLifecycleAdapter).
 */
class Application {
public:
    Application();
    ~Application();

    // Disable copy and move
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Initialize all application subsystems
     * @param configPath Config file; empty for the default location
     * @param debug Force debug logging
     * @return true if initialization successful
     */
    bool initialize(const std::string& configPath = "", bool debug = false);

    /**
     * Shutdown the application gracefully; the active transfer is suspended
     * and resumed on the next run
     */
    void shutdown();

    AppState getState() const { return m_state.load(); }

    bool isRunning() const;

    /**
     * Get download manager instance
     * @return Shared pointer to DownloadManager, null before initialize()
     */
    std::shared_ptr<downloader::DownloadManager> getDownloadManager() const { return m_downloadManager; }

    /**
     * Register state change callback
     * @param callback Function to call on state change
     */
    void onStateChange(std::function<void(AppState)> callback);

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "Lectern"; }

private:
    void setState(AppState state);

    bool loadConfiguration(const std::string& configPath);
    void initializeLogging(bool debug);
    bool initializeDownloader();

private:
    std::atomic<AppState> m_state{AppState::Uninitialized};

    std::vector<std::function<void(AppState)>> m_stateCallbacks;
    std::mutex m_callbackMutex;

    // Destroyed in reverse order by shutdown()
    std::unique_ptr<lifecycle::SignalLifecycleAdapter> m_lifecycle;
    std::unique_ptr<network::ProbeConnectivityMonitor> m_connectivity;
    std::unique_ptr<downloader::JsonTaskStore> m_store;
    std::unique_ptr<downloader::CprTransferClient> m_transferClient;
    std::shared_ptr<downloader::DownloadManager> m_downloadManager;
};

} // namespace lectern::core
