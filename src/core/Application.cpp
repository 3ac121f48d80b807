/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Logger.hpp"
#include "Config.hpp"
#include "downloader/CprTransferClient.hpp"
#include "downloader/DownloadManager.hpp"
#include "downloader/DownloadStorage.hpp"
#include "downloader/JsonTaskStore.hpp"
#include "lifecycle/SignalLifecycleAdapter.hpp"
#include "network/ProbeConnectivityMonitor.hpp"
#include "../utils/PathUtils.hpp"

#include <chrono>

namespace lectern::core {

using utils::PathUtils;

Application::Application() {
    LOG_DEBUG("Application instance created");
}

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
}

bool Application::initialize(const std::string& configPath, bool debug) {
    if (m_state != AppState::Uninitialized) {
        LOG_WARN("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);

    // Before any thread exists, so every thread inherits the mask
    m_lifecycle = std::make_unique<lifecycle::SignalLifecycleAdapter>();

    if (!loadConfiguration(configPath)) {
        setState(AppState::Error);
        return false;
    }
    initializeLogging(debug);

    LOG_INFO("{} v{} starting...", getName(), getVersion());

    auto startTime = std::chrono::steady_clock::now();

    if (!initializeDownloader()) {
        LOG_ERROR("Failed to initialize downloader");
        setState(AppState::Error);
        return false;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    LOG_INFO("Application initialized in {}ms", duration.count());

    setState(AppState::Ready);
    return true;
}

void Application::shutdown() {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    LOG_INFO("Shutting down application...");

    // The manager first: it suspends its transfer through the client and
    // unsubscribes from the signal sources
    m_downloadManager.reset();
    m_transferClient.reset();
    m_connectivity.reset();
    m_store.reset();
    m_lifecycle.reset();

    LOG_INFO("Application shutdown complete");
    Logger::instance().flush();

    setState(AppState::Uninitialized);
}

bool Application::isRunning() const {
    return m_state.load() == AppState::Ready;
}

void Application::onStateChange(std::function<void(AppState)> callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_stateCallbacks.push_back(std::move(callback));
}

void Application::setState(AppState state) {
    m_state = state;

    std::lock_guard<std::mutex> lock(m_callbackMutex);
    for (const auto& callback : m_stateCallbacks) {
        try {
            callback(state);
        } catch (const std::exception& e) {
            LOG_ERROR("State callback error: {}", e.what());
        }
    }
}

bool Application::loadConfiguration(const std::string& configPath) {
    auto& config = Config::instance();
    auto path = configPath.empty() ? PathUtils::getConfigPath().string() : configPath;

    try {
        if (std::filesystem::exists(path)) {
            if (!config.load(path)) {
                LOG_ERROR("Invalid configuration file {}", path);
                return false;
            }
            LOG_DEBUG("Configuration loaded from {}", path);
        } else {
            config.setDefaults();
            if (!config.save(path)) {
                LOG_WARN("Cannot write default configuration to {}", path);
            }
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to load configuration: {}", e.what());
        return false;
    }
}

void Application::initializeLogging(bool debug) {
    auto level = debug
        ? LogLevel::Debug
        : Logger::parseLevel(Config::instance().get<std::string>("logging.level", "info"));

    Logger::instance().initialize(level, PathUtils::getLogsPath().string());
}

bool Application::initializeDownloader() {
    auto& config = Config::instance();

    try {
        auto dataPath = PathUtils::resolve(config.get<std::string>("paths.data", ""), PathUtils::getDataPath());
        m_store = std::make_unique<downloader::JsonTaskStore>(dataPath / "downloads.json");

        m_connectivity = std::make_unique<network::ProbeConnectivityMonitor>(
            config.get<std::string>("network.probeUrl", "https://www.google.com/generate_204"),
            std::chrono::milliseconds(config.get<int>("network.probeIntervalMs", 5000))
        );

        m_transferClient = std::make_unique<downloader::CprTransferClient>();

        m_downloadManager = std::make_shared<downloader::DownloadManager>(
            *m_store,
            *m_transferClient,
            *m_connectivity,
            *m_lifecycle,
            downloader::DownloadStorage::fromConfig()
        );

        LOG_INFO("Task records at {}", m_store->getFilePath().string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Downloader initialization error: {}", e.what());
        return false;
    }
}

} // namespace lectern::core
