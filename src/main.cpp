/**
 * Lectern - Background course video downloader
 *
 * Main entry point for the lectern-dl command line tool.
 * Runs the download queue until interrupted, or until the queue drains
 * with --exit-when-done.
 *
 * Send SIGUSR1 to pause (background) and SIGUSR2 to resume (active).
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/Application.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include "core/downloader/DownloadManager.hpp"
#include "core/models/CourseBlock.hpp"

namespace {

using lectern::core::downloader::DownloadEvent;
using lectern::core::downloader::DownloadManager;
using lectern::core::downloader::DownloadTask;

volatile std::sig_atomic_t g_stopRequested = 0;

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int) {
    g_stopRequested = 1;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

struct Options {
    bool debug{false};
    std::string configPath;
    std::string catalogPath;
    std::string courseId;
    bool allowLarge{false};
    bool list{false};
    bool cancelAll{false};
    bool deleteAll{false};
    bool cleanup{false};
    bool exitWhenDone{false};
};

void printUsage(const char* program) {
    std::cout << "Lectern - Background course video downloader\n"
              << "\nUsage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -d, --debug              Enable debug logging\n"
              << "  -c, --config FILE        Use FILE as configuration\n"
              << "  -e, --enqueue CATALOG    Queue the video blocks of a catalog file\n"
              << "      --course ID          Only queue blocks of course ID\n"
              << "      --allow-large        Accept batches above 1 GiB\n"
              << "  -l, --list               List download tasks\n"
              << "      --cancel-all         Cancel every unfinished download\n"
              << "      --delete-all         Delete every download and its file\n"
              << "      --cleanup            Remove legacy cache folders\n"
              << "      --exit-when-done     Exit once no download is pending\n"
              << "  -h, --help               Show this help message\n"
              << "  -v, --version            Show version information\n"
              << std::endl;
}

void printTasks(const std::vector<DownloadTask>& tasks) {
    if (tasks.empty()) {
        std::cout << "No downloads" << std::endl;
        return;
    }

    for (const auto& task : tasks) {
        std::cout << lectern::core::downloader::toString(task.state) << "\t"
                  << task.blockId << "\t"
                  << task.fileSizeInMbText() << "\t"
                  << task.displayName << std::endl;
    }
}

void logEvent(const DownloadEvent& event) {
    using Type = DownloadEvent::Type;

    switch (event.type) {
        case Type::Started:
        case Type::Paused:
        case Type::Finished:
            LOG_INFO("[{}] {}", lectern::core::downloader::toString(event.type), event.task->displayName);
            break;
        case Type::Progress:
            LOG_DEBUG("[progress] {} {:.1f}%", event.task->displayName, event.fraction * 100.0);
            break;
        case Type::Canceled:
            LOG_INFO("[canceled] {} tasks", event.tasks.size());
            break;
        case Type::CourseCanceled:
            LOG_INFO("[courseCanceled] {}", event.courseId);
            break;
        case Type::DeletedFile:
            LOG_INFO("[deletedFile] {} files", event.blockIds.size());
            break;
        default:
            LOG_DEBUG("[{}]", lectern::core::downloader::toString(event.type));
            break;
    }
}

bool hasPendingWork(DownloadManager& manager) {
    if (manager.state() == lectern::core::downloader::ManagerState::Downloading) {
        return true;
    }

    auto tasks = manager.listTasks();
    return std::any_of(tasks.begin(), tasks.end(),
        [](const DownloadTask& task) { return !task.isFinished(); });
}

/**
 * Run the one-shot commands
 * @return Process exit code, 0 on success
 */
int runCommands(DownloadManager& manager, const Options& options) {
    if (options.cleanup) {
        auto removed = manager.removeAppSupportDirectoryUnusedContent();
        std::cout << "Removed " << removed << " legacy cache folders" << std::endl;
    }

    if (options.deleteAll) {
        manager.deleteAll();
    }

    if (options.cancelAll) {
        manager.cancelAll();
    }

    if (!options.catalogPath.empty()) {
        auto blocks = lectern::models::loadCatalog(options.catalogPath);
        if (!options.courseId.empty()) {
            blocks.erase(
                std::remove_if(blocks.begin(), blocks.end(),
                    [&](const lectern::models::CourseBlock& block) { return block.courseId != options.courseId; }),
                blocks.end()
            );
        }

        if (blocks.empty()) {
            std::cerr << "No blocks to download in " << options.catalogPath << std::endl;
            return 1;
        }

        if (manager.isLargeVideosSize(blocks) && !options.allowLarge) {
            std::cerr << "This batch is larger than 1 GiB; pass --allow-large to download it" << std::endl;
            return 2;
        }

        auto added = manager.enqueue(blocks);
        std::cout << "Queued " << added << " new downloads" << std::endl;
    }

    if (options.list) {
        printTasks(manager.listTasks());
    }

    return 0;
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    Options options;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                std::exit(64);
            }
            return argv[++i];
        };

        if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--config" || arg == "-c") {
            options.configPath = value();
        } else if (arg == "--enqueue" || arg == "-e") {
            options.catalogPath = value();
        } else if (arg == "--course") {
            options.courseId = value();
        } else if (arg == "--allow-large") {
            options.allowLarge = true;
        } else if (arg == "--list" || arg == "-l") {
            options.list = true;
        } else if (arg == "--cancel-all") {
            options.cancelAll = true;
        } else if (arg == "--delete-all") {
            options.deleteAll = true;
        } else if (arg == "--cleanup") {
            options.cleanup = true;
        } else if (arg == "--exit-when-done") {
            options.exitWhenDone = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << lectern::core::Application::getName() << " v"
                      << lectern::core::Application::getVersion() << std::endl;
            return 0;
        } else {
            std::cerr << "Unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 64;
        }
    }

    setupSignalHandlers();

    auto app = std::make_unique<lectern::core::Application>();
    if (!app->initialize(options.configPath, options.debug)) {
        LOG_CRITICAL("Failed to initialize application");
        return 1;
    }

    auto manager = app->getDownloadManager();
    auto subscription = manager->subscribe(logEvent);

    int exitCode = 0;
    try {
        exitCode = runCommands(*manager, options);
    } catch (const lectern::core::NoNetworkAccessError& e) {
        std::cerr << e.what() << " (check the connection or downloads.wifiOnly)" << std::endl;
        exitCode = 3;
    }

    bool oneShot = options.list || options.cancelAll || options.deleteAll || options.cleanup;
    bool keepRunning = exitCode == 0 && (!oneShot || !options.catalogPath.empty() || options.exitWhenDone);

    while (keepRunning && !g_stopRequested) {
        if (options.exitWhenDone && !hasPendingWork(*manager)) {
            LOG_INFO("No pending downloads");
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }

    manager->waitForEvents();
    manager->unsubscribe(subscription);
    manager.reset();

    app->shutdown();
    return exitCode;
}
