#pragma once

/**
 * DownloadManager.hpp
 *
 * Sequential background download queue for course videos.
 * Persists every task, survives restarts, pauses on connectivity loss or
 * backgrounding and resumes interrupted transfers from their resume token.
 */

#include "DownloadTask.hpp"
#include "DownloadStorage.hpp"
#include "TaskStore.hpp"
#include "TransferClient.hpp"
#include "../EventBus.hpp"
#include "../lifecycle/LifecycleSignals.hpp"
#include "../network/ConnectivityMonitor.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lectern::core::downloader {

/**
 * Download manager state
 */
enum class ManagerState {
    Idle,         // No active transfer
    Downloading,  // Exactly one active transfer
    Paused        // Offline or backgrounded; nothing starts
};

std::string toString(ManagerState state);

/**
 * Notification sent to the manager's subscribers
 */
struct DownloadEvent {
    enum class Type {
        Added,
        Started,
        Progress,
        Paused,
        Canceled,
        CourseCanceled,
        AllCanceled,
        Finished,
        DeletedFile,
        ClearedAll
    };

    Type type{Type::Added};

    // Started, Progress, Paused, Finished
    std::optional<DownloadTask> task;

    // Canceled
    std::vector<DownloadTask> tasks;

    // Progress
    double fraction{0.0};

    // CourseCanceled
    std::string courseId;

    // DeletedFile
    std::vector<std::string> blockIds;

    static DownloadEvent added();
    static DownloadEvent started(const DownloadTask& task);
    static DownloadEvent progress(double fraction, const DownloadTask& task);
    static DownloadEvent paused(const DownloadTask& task);
    static DownloadEvent canceled(std::vector<DownloadTask> tasks);
    static DownloadEvent courseCanceled(const std::string& courseId);
    static DownloadEvent allCanceled();
    static DownloadEvent finished(const DownloadTask& task);
    static DownloadEvent deletedFile(std::vector<std::string> blockIds);
    static DownloadEvent clearedAll();
};

std::string toString(DownloadEvent::Type type);

/**
 * DownloadManager - Single-active-transfer download queue
 *
 * Features:
 * - At most one transfer at a time, in queue order
 * - Wi-Fi only admission policy
 * - Pause with resume token on connectivity loss or backgrounding
 * - Crash recovery from the task store
 * - Ordered event stream and queue-size notifications
 *
 * Every public operation and every transfer callback runs under one mutex.
 * Events are delivered asynchronously on the event bus thread, so handlers
 * may call back into the manager.
 */
class DownloadManager {
public:
    using EventHandler = std::function<void(const DownloadEvent&)>;
    using QueueSizeHandler = std::function<void(size_t)>;

    /**
     * Constructor - sets the active user from the config, subscribes to
     * connectivity and lifecycle signals and resumes pending work
     *
     * The collaborators must outlive the manager.
     */
    DownloadManager(
        TaskStore& store,
        TransferClient& client,
        network::ConnectivityMonitor& connectivity,
        lifecycle::LifecycleSignals& lifecycle,
        DownloadStorage storage
    );

    /**
     * Destructor - releases subscriptions and suspends the active transfer,
     * persisting its resume token
     */
    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // -- Queue --

    /**
     * Add the downloadable blocks to the queue and start downloading
     * @param blocks Content blocks; blocks without a video are skipped
     * @return Number of tasks added
     * @throws NoNetworkAccessError if the admission policy denies it
     */
    size_t enqueue(const std::vector<models::CourseBlock>& blocks);

    std::vector<DownloadTask> listTasks();
    std::vector<DownloadTask> listTasksForCourse(const std::string& courseId);

    // -- Cancellation --
    // Cancelling the active transfer aborts it and discards its resume token.
    // Each variant advances the queue afterwards and throws
    // NoNetworkAccessError when that is denied.

    void cancel(const DownloadTask& task);
    void cancelForCourse(const std::string& courseId, const std::vector<models::CourseBlock>& blocks);
    void cancelForCourse(const std::string& courseId);

    /**
     * Cancel every task that is not finished
     */
    void cancelAll();

    // -- Deletion --

    /**
     * Remove the tasks and files of some blocks of a course
     */
    void deleteBlocks(const std::vector<models::CourseBlock>& blocks, const std::string& courseId);

    /**
     * Remove every task and file of the user, finished ones included
     */
    void deleteAll();

    // -- Control --

    /**
     * Continue the queue; no-op while downloading, paused or offline
     * @throws NoNetworkAccessError if the admission policy denies it
     */
    void resumeDownloading();

    // -- Queries --

    /**
     * Location of a finished block's file
     * @return Path, nullopt if the block is not downloaded
     */
    std::optional<std::filesystem::path> fileUrl(const std::string& blockId);

    /**
     * true if the blocks total more than 1 GiB at the configured quality
     */
    bool isLargeVideosSize(const std::vector<models::CourseBlock>& blocks) const;

    /**
     * Delete orphaned legacy cache folders
     * @return Number of folders removed
     */
    size_t removeAppSupportDirectoryUnusedContent();

    std::optional<DownloadTask> currentTask() const;
    ManagerState state() const;

    // -- Notifications --

    SubscriptionPtr subscribe(EventHandler handler);
    SubscriptionPtr subscribeQueueSize(QueueSizeHandler handler);
    void unsubscribe(const SubscriptionPtr& subscription);
    void unsubscribeQueueSize(const SubscriptionPtr& subscription);

    /**
     * Block until every published notification has been delivered
     */
    void waitForEvents();

private:
    /**
     * Shared with transfer callbacks; cleared before the manager goes away
     */
    struct CallbackGate {
        std::mutex mutex;
        bool alive{true};
    };

    // Signal handlers
    void onReachability(network::Reachability reachability);
    void onLifecycle(lifecycle::LifecycleEvent event);
    void resumeFromSignal();

    // Transfer callbacks
    void onTransferProgress(TransferHandle handle, double fraction);
    void onTransferComplete(TransferHandle handle, const TransferResult& result);

    // Locked helpers
    bool userCanDownloadLocked() const;
    void hydrateLocked();
    void advanceLocked();
    void advanceQuietlyLocked();
    void startTransferLocked(DownloadTask& task, const std::filesystem::path& destination);
    void waitingAllLocked();
    void cancelActiveLocked();
    std::vector<DownloadTask> removeTasksLocked(const std::vector<DownloadTask>& tasks);
    void handleFailureLocked(DownloadTask& task);
    DownloadTask* findLocked(const std::string& id);
    void publishQueueSizeLocked();

    models::DownloadQuality quality() const;

private:
    TaskStore& m_store;
    TransferClient& m_client;
    network::ConnectivityMonitor& m_connectivity;
    lifecycle::LifecycleSignals& m_lifecycle;
    DownloadStorage m_storage;

    int64_t m_userId{0};

    std::vector<DownloadTask> m_queue;
    ManagerState m_state{ManagerState::Idle};
    std::optional<std::string> m_currentTaskId;
    TransferHandle m_activeHandle{0};

    // Consecutive non-connectivity failures per task id
    std::unordered_map<std::string, int> m_failures;

    mutable std::mutex m_mutex;
    std::shared_ptr<CallbackGate> m_gate;

    SubscriptionPtr m_connectivitySubscription;
    SubscriptionPtr m_lifecycleSubscription;

    EventBus<DownloadEvent> m_events;
    EventBus<size_t> m_queueSize;
};

} // namespace lectern::core::downloader
