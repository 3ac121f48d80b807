/**
 * DownloadManager.cpp
 *
 * Implementation of the sequential download queue.
 */

#include "DownloadManager.hpp"
#include "../Config.hpp"
#include "../Errors.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <iterator>

namespace lectern::core::downloader {

using network::Reachability;
using lifecycle::LifecycleEvent;

std::string toString(ManagerState state) {
    switch (state) {
        case ManagerState::Idle:        return "idle";
        case ManagerState::Downloading: return "downloading";
        case ManagerState::Paused:      return "paused";
    }
    return "idle";
}

std::string toString(DownloadEvent::Type type) {
    switch (type) {
        case DownloadEvent::Type::Added:          return "added";
        case DownloadEvent::Type::Started:        return "started";
        case DownloadEvent::Type::Progress:       return "progress";
        case DownloadEvent::Type::Paused:         return "paused";
        case DownloadEvent::Type::Canceled:       return "canceled";
        case DownloadEvent::Type::CourseCanceled: return "courseCanceled";
        case DownloadEvent::Type::AllCanceled:    return "allCanceled";
        case DownloadEvent::Type::Finished:       return "finished";
        case DownloadEvent::Type::DeletedFile:    return "deletedFile";
        case DownloadEvent::Type::ClearedAll:     return "clearedAll";
    }
    return "added";
}

// -- DownloadEvent factories --

DownloadEvent DownloadEvent::added() {
    return DownloadEvent{};
}

DownloadEvent DownloadEvent::started(const DownloadTask& task) {
    DownloadEvent event;
    event.type = Type::Started;
    event.task = task;
    return event;
}

DownloadEvent DownloadEvent::progress(double fraction, const DownloadTask& task) {
    DownloadEvent event;
    event.type = Type::Progress;
    event.fraction = fraction;
    event.task = task;
    return event;
}

DownloadEvent DownloadEvent::paused(const DownloadTask& task) {
    DownloadEvent event;
    event.type = Type::Paused;
    event.task = task;
    return event;
}

DownloadEvent DownloadEvent::canceled(std::vector<DownloadTask> tasks) {
    DownloadEvent event;
    event.type = Type::Canceled;
    event.tasks = std::move(tasks);
    return event;
}

DownloadEvent DownloadEvent::courseCanceled(const std::string& courseId) {
    DownloadEvent event;
    event.type = Type::CourseCanceled;
    event.courseId = courseId;
    return event;
}

DownloadEvent DownloadEvent::allCanceled() {
    DownloadEvent event;
    event.type = Type::AllCanceled;
    return event;
}

DownloadEvent DownloadEvent::finished(const DownloadTask& task) {
    DownloadEvent event;
    event.type = Type::Finished;
    event.task = task;
    return event;
}

DownloadEvent DownloadEvent::deletedFile(std::vector<std::string> blockIds) {
    DownloadEvent event;
    event.type = Type::DeletedFile;
    event.blockIds = std::move(blockIds);
    return event;
}

DownloadEvent DownloadEvent::clearedAll() {
    DownloadEvent event;
    event.type = Type::ClearedAll;
    return event;
}

// -- Construction --

DownloadManager::DownloadManager(
    TaskStore& store,
    TransferClient& client,
    network::ConnectivityMonitor& connectivity,
    lifecycle::LifecycleSignals& lifecycle,
    DownloadStorage storage
)
    : m_store(store)
    , m_client(client)
    , m_connectivity(connectivity)
    , m_lifecycle(lifecycle)
    , m_storage(std::move(storage))
    , m_gate(std::make_shared<CallbackGate>()) {

    m_userId = Config::instance().get<int64_t>("user.id", 0);
    m_store.setActiveUser(m_userId);

    m_connectivitySubscription = m_connectivity.subscribe([this](Reachability reachability) {
        onReachability(reachability);
    });
    m_lifecycleSubscription = m_lifecycle.subscribe([this](LifecycleEvent event) {
        onLifecycle(event);
    });

    LOG_INFO("DownloadManager ready for user {}", m_userId);

    // Pick up tasks left behind by a previous run
    try {
        resumeDownloading();
    } catch (const NoNetworkAccessError& e) {
        LOG_INFO("Pending downloads not resumed: {}", e.what());
    }
}

DownloadManager::~DownloadManager() {
    // Must not hold m_mutex here: unsubscribe waits for in-flight handlers
    m_connectivity.unsubscribe(m_connectivitySubscription);
    m_lifecycle.unsubscribe(m_lifecycleSubscription);

    {
        std::lock_guard<std::mutex> gateLock(m_gate->mutex);
        m_gate->alive = false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_activeHandle == 0) {
        return;
    }

    auto token = m_client.suspend(m_activeHandle);
    m_activeHandle = 0;

    if (m_currentTaskId) {
        if (auto* task = findLocked(*m_currentTaskId)) {
            task->state = DownloadState::Waiting;
            task->resumeData = token;
            m_store.updateState(task->id, DownloadState::Waiting, token);
            LOG_INFO("Suspended {} for the next run", task->id);
        }
    }
}

// -- Queue --

size_t DownloadManager::enqueue(const std::vector<models::CourseBlock>& blocks) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!userCanDownloadLocked()) {
        LOG_WARN("Enqueue of {} blocks denied by the network policy", blocks.size());
        throw NoNetworkAccessError();
    }

    hydrateLocked();

    auto downloadQuality = quality();
    std::vector<models::CourseBlock> accepted;
    size_t added = 0;

    for (const auto& block : blocks) {
        auto task = DownloadTask::fromBlock(block, m_userId, downloadQuality);
        if (!task) {
            LOG_WARN("Block '{}' has no downloadable video at {} or an unusable id, skipped",
                     block.id, models::toString(downloadQuality));
            continue;
        }

        accepted.push_back(block);
        if (findLocked(task->id)) {
            continue;
        }

        LOG_DEBUG("Queued {} ({})", task->id, task->fileSizeInMbText());
        m_queue.push_back(std::move(*task));
        ++added;
    }

    if (!accepted.empty()) {
        m_store.upsertTasksFromBlocks(accepted, downloadQuality);
    }

    LOG_INFO("Enqueued {} of {} blocks", added, blocks.size());

    if (added > 0) {
        publishQueueSizeLocked();
    }
    m_events.publish(DownloadEvent::added());

    advanceLocked();
    return added;
}

std::vector<DownloadTask> DownloadManager::listTasks() {
    std::lock_guard<std::mutex> lock(m_mutex);
    hydrateLocked();
    return m_queue;
}

std::vector<DownloadTask> DownloadManager::listTasksForCourse(const std::string& courseId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    hydrateLocked();

    std::vector<DownloadTask> result;
    std::copy_if(m_queue.begin(), m_queue.end(), std::back_inserter(result),
        [&](const DownloadTask& task) { return task.courseId == courseId; });
    return result;
}

// -- Cancellation --

void DownloadManager::cancel(const DownloadTask& task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    hydrateLocked();

    auto* queued = findLocked(task.id);
    removeTasksLocked({queued ? *queued : task});

    LOG_INFO("Cancelled {}", task.id);
    advanceLocked();
}

void DownloadManager::cancelForCourse(const std::string& courseId, const std::vector<models::CourseBlock>& blocks) {
    std::lock_guard<std::mutex> lock(m_mutex);
    hydrateLocked();

    std::vector<DownloadTask> targets;
    for (const auto& task : m_queue) {
        if (task.courseId != courseId) continue;

        bool listed = std::any_of(blocks.begin(), blocks.end(),
            [&](const models::CourseBlock& block) { return block.id == task.blockId; });
        if (listed) {
            targets.push_back(task);
        }
    }

    // Partial cancel: deletedFile only, courseCanceled is for the whole course
    removeTasksLocked(targets);

    LOG_INFO("Cancelled {} tasks of course {}", targets.size(), courseId);
    advanceLocked();
}

void DownloadManager::cancelForCourse(const std::string& courseId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    hydrateLocked();

    std::vector<DownloadTask> targets;
    std::copy_if(m_queue.begin(), m_queue.end(), std::back_inserter(targets),
        [&](const DownloadTask& task) { return task.courseId == courseId; });

    removeTasksLocked(targets);
    m_events.publish(DownloadEvent::courseCanceled(courseId));

    LOG_INFO("Cancelled course {} ({} tasks)", courseId, targets.size());
    advanceLocked();
}

void DownloadManager::cancelAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    hydrateLocked();

    cancelActiveLocked();

    std::vector<DownloadTask> targets;
    std::copy_if(m_queue.begin(), m_queue.end(), std::back_inserter(targets),
        [](const DownloadTask& task) { return !task.isFinished(); });

    removeTasksLocked(targets);
    m_events.publish(DownloadEvent::allCanceled());

    LOG_INFO("Cancelled all downloads ({} tasks)", targets.size());
    advanceLocked();
}

// -- Deletion --

void DownloadManager::deleteBlocks(const std::vector<models::CourseBlock>& blocks, const std::string& courseId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    hydrateLocked();

    std::vector<DownloadTask> targets;
    for (const auto& task : m_queue) {
        if (task.courseId != courseId) continue;

        bool listed = std::any_of(blocks.begin(), blocks.end(),
            [&](const models::CourseBlock& block) { return block.id == task.blockId; });
        if (listed) {
            targets.push_back(task);
        }
    }

    removeTasksLocked(targets);
    LOG_INFO("Deleted {} downloads of course {}", targets.size(), courseId);

    advanceQuietlyLocked();
}

void DownloadManager::deleteAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    hydrateLocked();

    auto targets = m_queue;
    removeTasksLocked(targets);
    m_events.publish(DownloadEvent::clearedAll());

    LOG_INFO("Deleted all downloads ({} tasks)", targets.size());
    advanceQuietlyLocked();
}

// -- Control --

void DownloadManager::resumeDownloading() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_state != ManagerState::Idle) {
        LOG_DEBUG("Resume ignored while {}", toString(m_state));
        return;
    }
    if (!m_connectivity.isInternetAvailable()) {
        LOG_DEBUG("Resume ignored while offline");
        return;
    }

    hydrateLocked();
    advanceLocked();
}

void DownloadManager::onReachability(Reachability reachability) {
    if (reachability == Reachability::Reachable) {
        LOG_INFO("Network reachable, resuming downloads");
        resumeFromSignal();
        return;
    }

    LOG_INFO("Network unreachable, pausing downloads");
    std::lock_guard<std::mutex> lock(m_mutex);
    waitingAllLocked();
}

void DownloadManager::onLifecycle(LifecycleEvent event) {
    if (event == LifecycleEvent::BecameActive) {
        LOG_INFO("Application active, resuming downloads");
        resumeFromSignal();
        return;
    }

    LOG_INFO("Application in background, pausing downloads");
    std::lock_guard<std::mutex> lock(m_mutex);
    waitingAllLocked();
}

void DownloadManager::resumeFromSignal() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_state == ManagerState::Paused) {
        m_state = ManagerState::Idle;
    }
    if (m_state == ManagerState::Downloading || !m_connectivity.isInternetAvailable()) {
        return;
    }

    hydrateLocked();
    advanceQuietlyLocked();
}

// -- Queries --

std::optional<std::filesystem::path> DownloadManager::fileUrl(const std::string& blockId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::optional<DownloadTask> task;
    if (m_queue.empty()) {
        task = m_store.getTask(blockId);
    } else {
        auto it = std::find_if(m_queue.begin(), m_queue.end(),
            [&](const DownloadTask& queued) { return queued.blockId == blockId; });
        if (it != m_queue.end()) {
            task = *it;
        }
    }

    if (!task || task->url.empty() || !task->isFinished()) {
        return std::nullopt;
    }
    return m_storage.locateFile(m_userId, task->fileName);
}

bool DownloadManager::isLargeVideosSize(const std::vector<models::CourseBlock>& blocks) const {
    auto downloadQuality = quality();

    double total = 0.0;
    for (const auto& block : blocks) {
        total += static_cast<double>(block.projectedSize(downloadQuality));
    }

    return total / 1024.0 / 1024.0 / 1024.0 > 1.0;
}

size_t DownloadManager::removeAppSupportDirectoryUnusedContent() {
    return m_storage.removeLegacyCacheFolders();
}

std::optional<DownloadTask> DownloadManager::currentTask() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_currentTaskId) {
        return std::nullopt;
    }

    auto it = std::find_if(m_queue.begin(), m_queue.end(),
        [&](const DownloadTask& task) { return task.id == *m_currentTaskId; });
    if (it == m_queue.end()) {
        return std::nullopt;
    }
    return *it;
}

ManagerState DownloadManager::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

// -- Notifications --

SubscriptionPtr DownloadManager::subscribe(EventHandler handler) {
    return m_events.subscribe(std::move(handler));
}

SubscriptionPtr DownloadManager::subscribeQueueSize(QueueSizeHandler handler) {
    return m_queueSize.subscribe(std::move(handler));
}

void DownloadManager::unsubscribe(const SubscriptionPtr& subscription) {
    m_events.unsubscribe(subscription);
}

void DownloadManager::unsubscribeQueueSize(const SubscriptionPtr& subscription) {
    m_queueSize.unsubscribe(subscription);
}

void DownloadManager::waitForEvents() {
    m_events.waitIdle();
    m_queueSize.waitIdle();
}

// -- Transfer callbacks --

void DownloadManager::onTransferProgress(TransferHandle handle, double fraction) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (handle == 0 || handle != m_activeHandle || !m_currentTaskId) {
        return;
    }

    auto* task = findLocked(*m_currentTaskId);
    if (!task) {
        return;
    }

    task->progress = fraction;
    LOG_TRACE("{} at {}", task->id, utils::StringUtils::formatPercentage(fraction));
    m_events.publish(DownloadEvent::progress(fraction, *task));
}

void DownloadManager::onTransferComplete(TransferHandle handle, const TransferResult& result) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (handle == 0 || handle != m_activeHandle) {
        LOG_DEBUG("Ignoring completion of stale transfer {}", handle);
        return;
    }

    m_activeHandle = 0;
    auto* task = m_currentTaskId ? findLocked(*m_currentTaskId) : nullptr;
    m_currentTaskId.reset();
    m_state = ManagerState::Idle;

    if (!task) {
        advanceQuietlyLocked();
        return;
    }

    switch (result.outcome) {
        case TransferOutcome::Success:
            task->state = DownloadState::Finished;
            task->progress = 1.0;
            task->resumeData.reset();
            m_failures.erase(task->id);
            m_store.updateState(task->id, DownloadState::Finished, std::nullopt);

            LOG_INFO("Downloaded {} ({})", task->id, task->fileSizeInMbText());
            m_events.publish(DownloadEvent::finished(*task));
            advanceQuietlyLocked();
            break;

        case TransferOutcome::NetworkError:
        case TransferOutcome::Suspended:
        case TransferOutcome::Cancelled:
            // Waits for a connectivity or lifecycle trigger
            task->state = DownloadState::Waiting;
            task->resumeData = result.resumeData;
            m_store.updateState(task->id, DownloadState::Waiting, task->resumeData);

            LOG_WARN("Download of {} interrupted ({}), resumable: {}",
                     task->id, result.error, task->resumeData.has_value());
            m_events.publish(DownloadEvent::paused(*task));
            break;

        case TransferOutcome::HttpError:
        case TransferOutcome::IoError:
            LOG_WARN("Download of {} failed: {} (HTTP {})", task->id, result.error, result.httpStatus);
            handleFailureLocked(*task);
            advanceQuietlyLocked();
            break;
    }
}

// -- Locked helpers --

bool DownloadManager::userCanDownloadLocked() const {
    if (!m_connectivity.isInternetAvailable()) {
        return false;
    }

    bool wifiOnly = Config::instance().get<bool>("downloads.wifiOnly", true);
    return !(wifiOnly && m_connectivity.isMeteredConnection());
}

void DownloadManager::hydrateLocked() {
    if (!m_queue.empty()) {
        return;
    }

    m_queue = m_store.getAllTasks(m_userId);
    if (m_queue.empty()) {
        return;
    }

    // Left InProgress by a run that did not shut down cleanly
    for (auto& task : m_queue) {
        if (task.state == DownloadState::InProgress) {
            task.state = DownloadState::Waiting;
            m_store.updateState(task.id, DownloadState::Waiting, task.resumeData);
            LOG_INFO("Recovered interrupted download {}", task.id);
        }
    }

    LOG_DEBUG("Loaded {} tasks from the store", m_queue.size());
    publishQueueSizeLocked();
}

void DownloadManager::advanceLocked() {
    if (m_state == ManagerState::Paused) {
        return;
    }
    if (!userCanDownloadLocked()) {
        throw NoNetworkAccessError();
    }
    if (m_activeHandle != 0) {
        return;
    }

    while (true) {
        auto it = std::find_if(m_queue.begin(), m_queue.end(),
            [](const DownloadTask& task) { return !task.isFinished(); });

        if (it == m_queue.end()) {
            m_currentTaskId.reset();
            if (m_state != ManagerState::Idle) {
                LOG_INFO("Download queue drained");
            }
            m_state = ManagerState::Idle;
            return;
        }

        auto destination = m_storage.filePath(m_userId, it->fileName);
        if (!destination) {
            LOG_ERROR("No videos folder for user {}, dropping {}", m_userId, it->id);
            removeTasksLocked({*it});
            continue;
        }

        startTransferLocked(*it, *destination);
        return;
    }
}

void DownloadManager::advanceQuietlyLocked() {
    try {
        advanceLocked();
    } catch (const NoNetworkAccessError& e) {
        LOG_INFO("Download queue halted: {}", e.what());
    }
}

void DownloadManager::startTransferLocked(DownloadTask& task, const std::filesystem::path& destination) {
    auto token = std::move(task.resumeData);
    task.resumeData.reset();
    task.state = DownloadState::InProgress;
    if (!token) {
        task.progress = 0.0;
    }

    m_store.updateState(task.id, DownloadState::InProgress, std::nullopt);
    m_currentTaskId = task.id;
    m_state = ManagerState::Downloading;
    m_events.publish(DownloadEvent::started(task));

    auto gate = m_gate;
    auto onProgress = [this, gate](TransferHandle handle, double fraction) {
        std::lock_guard<std::mutex> gateLock(gate->mutex);
        if (gate->alive) {
            onTransferProgress(handle, fraction);
        }
    };
    auto onComplete = [this, gate](TransferHandle handle, const TransferResult& result) {
        std::lock_guard<std::mutex> gateLock(gate->mutex);
        if (gate->alive) {
            onTransferComplete(handle, result);
        }
    };

    if (token) {
        m_activeHandle = m_client.resume(*token, destination, onProgress, onComplete);
        LOG_INFO("Resuming {} -> {}", task.id, destination.string());
    } else {
        m_activeHandle = m_client.start(task.url, destination, onProgress, onComplete);
        LOG_INFO("Downloading {} -> {}", task.id, destination.string());
    }
}

void DownloadManager::waitingAllLocked() {
    if (m_state == ManagerState::Paused) {
        return;
    }

    if (m_activeHandle != 0) {
        auto token = m_client.suspend(m_activeHandle);
        m_activeHandle = 0;

        if (m_currentTaskId) {
            if (auto* task = findLocked(*m_currentTaskId)) {
                task->resumeData = token;
            }
        }
    }
    m_currentTaskId.reset();

    for (auto& task : m_queue) {
        if (task.state == DownloadState::InProgress) {
            task.state = DownloadState::Waiting;
            m_store.updateState(task.id, DownloadState::Waiting, task.resumeData);
        }
    }

    m_events.publish(DownloadEvent::added());
    m_state = ManagerState::Paused;
    LOG_INFO("Downloads paused");
}

void DownloadManager::cancelActiveLocked() {
    if (m_activeHandle != 0) {
        m_client.cancel(m_activeHandle);
        m_activeHandle = 0;
    }

    m_currentTaskId.reset();
    if (m_state == ManagerState::Downloading) {
        m_state = ManagerState::Idle;
    }
}

std::vector<DownloadTask> DownloadManager::removeTasksLocked(const std::vector<DownloadTask>& tasks) {
    if (tasks.empty()) {
        return {};
    }

    std::vector<std::string> ids;
    std::vector<std::string> fileNames;
    std::vector<std::string> blockIds;

    for (const auto& task : tasks) {
        if (m_currentTaskId && *m_currentTaskId == task.id) {
            cancelActiveLocked();
        }

        ids.push_back(task.id);
        fileNames.push_back(task.fileName);
        blockIds.push_back(task.blockId);
        m_failures.erase(task.id);
    }

    m_queue.erase(
        std::remove_if(m_queue.begin(), m_queue.end(),
            [&](const DownloadTask& task) {
                return std::find(ids.begin(), ids.end(), task.id) != ids.end();
            }),
        m_queue.end()
    );

    m_store.deleteTasks(ids);
    m_storage.removeFiles(m_userId, fileNames);

    m_events.publish(DownloadEvent::deletedFile(std::move(blockIds)));
    publishQueueSizeLocked();
    return tasks;
}

void DownloadManager::handleFailureLocked(DownloadTask& task) {
    int maxAttempts = std::max(1, Config::instance().get<int>("downloads.maxAttempts", 3));
    int attempts = ++m_failures[task.id];

    m_storage.removeFiles(m_userId, {task.fileName});

    if (attempts >= maxAttempts) {
        LOG_ERROR("Giving up on {} after {} attempts", task.id, attempts);

        // task points into m_queue, which the removal reshapes
        DownloadTask failed = task;
        removeTasksLocked({failed});
        m_events.publish(DownloadEvent::canceled({failed}));
        return;
    }

    task.state = DownloadState::Waiting;
    task.progress = 0.0;
    task.resumeData.reset();
    m_store.updateState(task.id, DownloadState::Waiting, std::nullopt);

    LOG_INFO("Retrying {} (attempt {} of {})", task.id, attempts + 1, maxAttempts);
    // The task is Waiting again; finished only tells consumers to re-render it
    m_events.publish(DownloadEvent::finished(task));
}

DownloadTask* DownloadManager::findLocked(const std::string& id) {
    auto it = std::find_if(m_queue.begin(), m_queue.end(),
        [&](const DownloadTask& task) { return task.id == id; });
    return it != m_queue.end() ? &*it : nullptr;
}

void DownloadManager::publishQueueSizeLocked() {
    m_queueSize.publish(m_queue.size());
}

models::DownloadQuality DownloadManager::quality() const {
    return models::downloadQualityFromString(
        Config::instance().get<std::string>("downloads.quality", "auto")
    );
}

} // namespace lectern::core::downloader
