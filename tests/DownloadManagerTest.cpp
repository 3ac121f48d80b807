/**
 * DownloadManagerTest.cpp
 *
 * Queue driving, admission, pause/resume and cancellation of the download
 * manager against fake collaborators.
 */

#include "TestSupport.hpp"

#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/downloader/DownloadManager.hpp"
#include "core/downloader/JsonTaskStore.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

namespace lectern::test {
namespace {

using core::Config;
using core::NoNetworkAccessError;
using core::downloader::DownloadEvent;
using core::downloader::DownloadManager;
using core::downloader::DownloadState;
using core::downloader::DownloadStorage;
using core::downloader::DownloadTask;
using core::downloader::JsonTaskStore;
using core::downloader::ManagerState;
using core::downloader::TransferOutcome;
using core::downloader::TransferResult;
using core::lifecycle::LifecycleEvent;
using Type = DownloadEvent::Type;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

constexpr int64_t kUserId = 7;

class DownloadManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& config = Config::instance();
        config.setDefaults();
        config.set<int64_t>("user.id", kUserId);
        config.set<bool>("downloads.wifiOnly", true);
        config.set<int>("downloads.maxAttempts", 3);

        store = std::make_unique<JsonTaskStore>(dir.path() / "data" / "downloads.json");
    }

    void TearDown() override {
        manager.reset();
        Config::instance().setDefaults();
    }

    void createManager() {
        manager = std::make_unique<DownloadManager>(
            *store, client, connectivity, lifecycle, storage());
        subscription = manager->subscribe([this](const DownloadEvent& event) {
            recorder.record(event);
        });
        queueSizeSubscription = manager->subscribeQueueSize([this](size_t size) {
            std::lock_guard<std::mutex> lock(sizeMutex);
            queueSizes.push_back(size);
        });
    }

    DownloadStorage storage() const {
        return DownloadStorage(documents(), dir.path() / "support");
    }

    fs::path documents() const {
        return dir.path() / "documents";
    }

    fs::path videoPath(const std::string& fileName) const {
        return documents() / "7_Files" / fileName;
    }

    std::vector<DownloadTask> tasks() {
        return manager->listTasks();
    }

    DownloadTask task(const std::string& blockId) {
        for (const auto& t : manager->listTasks()) {
            if (t.blockId == blockId) return t;
        }
        ADD_FAILURE() << "no task for block " << blockId;
        return DownloadTask{};
    }

    size_t inProgressCount() {
        auto all = manager->listTasks();
        return std::count_if(all.begin(), all.end(),
            [](const DownloadTask& t) { return t.state == DownloadState::InProgress; });
    }

    std::vector<DownloadEvent::Type> eventTypes() {
        manager->waitForEvents();
        return recorder.types();
    }

    std::vector<size_t> sizes() {
        manager->waitForEvents();
        std::lock_guard<std::mutex> lock(sizeMutex);
        return queueSizes;
    }

    static TransferResult failure(TransferOutcome outcome, int status = 0) {
        TransferResult result;
        result.outcome = outcome;
        result.httpStatus = status;
        result.error = "failed";
        return result;
    }

    TempDir dir;
    std::unique_ptr<JsonTaskStore> store;
    FakeTransferClient client;
    FakeConnectivity connectivity;
    FakeLifecycle lifecycle;
    EventRecorder recorder;
    std::mutex sizeMutex;
    std::vector<size_t> queueSizes;
    core::SubscriptionPtr subscription;
    core::SubscriptionPtr queueSizeSubscription;

    // Declared last: destroyed before the collaborators
    std::unique_ptr<DownloadManager> manager;
};

// -- Enqueue --

TEST_F(DownloadManagerTest, EnqueueStartsFirstTaskOnly) {
    createManager();

    EXPECT_EQ(manager->enqueue({makeBlock("b1"), makeBlock("b2"), makeBlock("b3")}), 3u);

    auto all = tasks();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].state, DownloadState::InProgress);
    EXPECT_EQ(all[1].state, DownloadState::Waiting);
    EXPECT_EQ(all[2].state, DownloadState::Waiting);
    EXPECT_EQ(manager->state(), ManagerState::Downloading);

    ASSERT_EQ(client.count(), 1u);
    EXPECT_EQ(client.last().url, "https://cdn.example.com/videos/b1.mp4");
    EXPECT_EQ(client.last().destination, videoPath("b1.mp4"));

    auto persisted = store->getAllTasks(kUserId);
    ASSERT_EQ(persisted.size(), 3u);
    EXPECT_EQ(persisted[0].state, DownloadState::InProgress);
    EXPECT_EQ(persisted[1].state, DownloadState::Waiting);
    EXPECT_EQ(persisted[2].state, DownloadState::Waiting);

    EXPECT_THAT(eventTypes(), ElementsAre(Type::Added, Type::Started));
    ASSERT_TRUE(manager->currentTask());
    EXPECT_EQ(manager->currentTask()->blockId, "b1");
}

TEST_F(DownloadManagerTest, EnqueueSameBlockTwiceKeepsOneTask) {
    createManager();

    EXPECT_EQ(manager->enqueue({makeBlock("b1")}), 1u);
    EXPECT_EQ(manager->enqueue({makeBlock("b1")}), 0u);

    EXPECT_EQ(tasks().size(), 1u);
    EXPECT_EQ(store->getAllTasks(kUserId).size(), 1u);
    EXPECT_EQ(client.count(), 1u);
}

TEST_F(DownloadManagerTest, EnqueueSkipsBlocksWithoutVideo) {
    createManager();

    auto noVideo = makeBlock("text");
    noVideo.encodedVideo.reset();
    auto noExtension = makeBlock("stream");
    noExtension.encodedVideo->mobileLow->url = "https://cdn.example.com/videos/stream";

    EXPECT_EQ(manager->enqueue({noVideo, makeBlock("b1"), noExtension}), 1u);

    auto all = tasks();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].blockId, "b1");
    EXPECT_EQ(store->getAllTasks(kUserId).size(), 1u);
}

TEST_F(DownloadManagerTest, MeteredConnectionWithWifiOnlyRejectsEnqueue) {
    connectivity.setMetered(true);
    createManager();

    EXPECT_THROW(manager->enqueue({makeBlock("b1")}), NoNetworkAccessError);

    EXPECT_TRUE(tasks().empty());
    EXPECT_TRUE(store->getAllTasks(kUserId).empty());
    EXPECT_EQ(client.count(), 0u);
}

TEST_F(DownloadManagerTest, MeteredConnectionWithoutWifiOnlyAcceptsEnqueue) {
    connectivity.setMetered(true);
    Config::instance().set<bool>("downloads.wifiOnly", false);
    createManager();

    EXPECT_EQ(manager->enqueue({makeBlock("b1")}), 1u);
    EXPECT_EQ(client.count(), 1u);
}

TEST_F(DownloadManagerTest, OfflineRejectsEnqueue) {
    connectivity.setAvailable(false);
    Config::instance().set<bool>("downloads.wifiOnly", false);
    createManager();

    EXPECT_THROW(manager->enqueue({makeBlock("b1")}), NoNetworkAccessError);
    EXPECT_TRUE(tasks().empty());
}

// -- Progress and completion --

TEST_F(DownloadManagerTest, ProgressUpdatesCurrentTaskAndIsNotPersisted) {
    createManager();
    manager->enqueue({makeBlock("b1")});

    client.progress(client.last().handle, 0.25);

    ASSERT_TRUE(manager->currentTask());
    EXPECT_DOUBLE_EQ(manager->currentTask()->progress, 0.25);
    EXPECT_DOUBLE_EQ(store->getAllTasks(kUserId)[0].progress, 0.0);

    manager->waitForEvents();
    auto events = recorder.events();
    ASSERT_EQ(events.back().type, Type::Progress);
    EXPECT_DOUBLE_EQ(events.back().fraction, 0.25);
    EXPECT_EQ(events.back().task->blockId, "b1");
}

TEST_F(DownloadManagerTest, CompletionAdvancesToNextTask) {
    createManager();
    manager->enqueue({makeBlock("b1"), makeBlock("b2")});
    auto first = client.last().handle;

    client.succeed(first);

    EXPECT_EQ(task("b1").state, DownloadState::Finished);
    EXPECT_EQ(task("b2").state, DownloadState::InProgress);
    EXPECT_EQ(store->getTask("b1")->state, DownloadState::Finished);
    ASSERT_EQ(client.count(), 2u);
    EXPECT_EQ(client.last().url, "https://cdn.example.com/videos/b2.mp4");
    EXPECT_EQ(manager->state(), ManagerState::Downloading);

    client.succeed(client.last().handle);

    EXPECT_EQ(manager->state(), ManagerState::Idle);
    EXPECT_FALSE(manager->currentTask());
    EXPECT_THAT(eventTypes(), ElementsAre(
        Type::Added, Type::Started, Type::Finished, Type::Started, Type::Finished));
}

TEST_F(DownloadManagerTest, FileUrlOnlyForFinishedTasks) {
    createManager();
    manager->enqueue({makeBlock("b1")});

    EXPECT_FALSE(manager->fileUrl("b1"));
    EXPECT_FALSE(manager->fileUrl("unknown"));

    client.succeed(client.last().handle);

    auto url = manager->fileUrl("b1");
    ASSERT_TRUE(url);
    EXPECT_EQ(*url, videoPath("b1.mp4"));
}

TEST_F(DownloadManagerTest, AtMostOneTransferInProgress) {
    createManager();
    manager->enqueue({makeBlock("b1"), makeBlock("b2")});
    EXPECT_EQ(inProgressCount(), 1u);

    manager->enqueue({makeBlock("b3")});
    EXPECT_EQ(inProgressCount(), 1u);

    manager->resumeDownloading();
    EXPECT_EQ(inProgressCount(), 1u);
    EXPECT_EQ(client.count(), 1u);

    manager->cancel(task("b1"));
    EXPECT_EQ(inProgressCount(), 1u);
    EXPECT_EQ(client.count(), 2u);

    client.succeed(client.last().handle);
    EXPECT_EQ(inProgressCount(), 1u);
    EXPECT_EQ(task("b3").state, DownloadState::InProgress);
}

// -- Pause and resume --

TEST_F(DownloadManagerTest, ConnectivityLossSuspendsWithResumeToken) {
    createManager();
    manager->enqueue({makeBlock("b1"), makeBlock("b2")});
    auto handle = client.last().handle;
    recorder.clear();

    connectivity.goOffline();

    EXPECT_TRUE(client.get(handle).suspended);
    EXPECT_FALSE(client.get(handle).cancelled);
    EXPECT_EQ(manager->state(), ManagerState::Paused);

    auto paused = task("b1");
    EXPECT_EQ(paused.state, DownloadState::Waiting);
    ASSERT_TRUE(paused.resumeData);
    EXPECT_EQ(*paused.resumeData, FakeTransferClient::tokenFor(handle));

    auto persisted = store->getTask("b1");
    ASSERT_TRUE(persisted);
    EXPECT_EQ(persisted->state, DownloadState::Waiting);
    EXPECT_EQ(persisted->resumeData, paused.resumeData);

    EXPECT_THAT(eventTypes(), ElementsAre(Type::Added));
    EXPECT_THROW(manager->enqueue({makeBlock("b3")}), NoNetworkAccessError);

    connectivity.goOnline();

    EXPECT_EQ(manager->state(), ManagerState::Downloading);
    ASSERT_EQ(client.count(), 2u);
    auto resumed = client.last();
    ASSERT_TRUE(resumed.resumedFrom);
    EXPECT_EQ(*resumed.resumedFrom, FakeTransferClient::tokenFor(handle));
    EXPECT_EQ(resumed.destination, videoPath("b1.mp4"));
    EXPECT_EQ(task("b1").state, DownloadState::InProgress);
    EXPECT_EQ(inProgressCount(), 1u);
}

TEST_F(DownloadManagerTest, BackgroundPausesAndActiveResumes) {
    createManager();
    manager->enqueue({makeBlock("b1")});
    auto handle = client.last().handle;

    lifecycle.send(LifecycleEvent::EnteredBackground);
    EXPECT_EQ(manager->state(), ManagerState::Paused);

    // Explicit resume is ignored while paused
    manager->resumeDownloading();
    EXPECT_EQ(manager->state(), ManagerState::Paused);
    EXPECT_EQ(client.count(), 1u);

    lifecycle.send(LifecycleEvent::BecameActive);
    EXPECT_EQ(manager->state(), ManagerState::Downloading);
    ASSERT_EQ(client.count(), 2u);
    EXPECT_EQ(client.last().resumedFrom, FakeTransferClient::tokenFor(handle));
}

TEST_F(DownloadManagerTest, RepeatedPauseIsIgnored) {
    createManager();
    manager->enqueue({makeBlock("b1")});
    recorder.clear();

    lifecycle.send(LifecycleEvent::EnteredBackground);
    connectivity.goOffline();

    EXPECT_THAT(eventTypes(), ElementsAre(Type::Added));
    EXPECT_EQ(manager->state(), ManagerState::Paused);
}

TEST_F(DownloadManagerTest, StaleCallbacksAfterSuspendAreIgnored) {
    createManager();
    manager->enqueue({makeBlock("b1")});
    auto handle = client.last().handle;

    lifecycle.send(LifecycleEvent::EnteredBackground);
    recorder.clear();

    client.progress(handle, 0.9);
    client.complete(handle, failure(TransferOutcome::Suspended));

    EXPECT_TRUE(eventTypes().empty());
    EXPECT_EQ(task("b1").state, DownloadState::Waiting);
    EXPECT_EQ(task("b1").resumeData, FakeTransferClient::tokenFor(handle));
}

TEST_F(DownloadManagerTest, NetworkFailureKeepsTokenAndWaits) {
    createManager();
    manager->enqueue({makeBlock("b1"), makeBlock("b2")});
    auto handle = client.last().handle;

    auto result = failure(TransferOutcome::NetworkError);
    result.resumeData = FakeTransferClient::tokenFor(99);
    client.complete(handle, result);

    EXPECT_EQ(manager->state(), ManagerState::Idle);
    EXPECT_EQ(client.count(), 1u);
    EXPECT_EQ(task("b1").state, DownloadState::Waiting);
    EXPECT_EQ(task("b1").resumeData, FakeTransferClient::tokenFor(99));
    EXPECT_EQ(store->getTask("b1")->resumeData, FakeTransferClient::tokenFor(99));
    EXPECT_EQ(eventTypes().back(), Type::Paused);

    manager->resumeDownloading();

    ASSERT_EQ(client.count(), 2u);
    EXPECT_EQ(client.last().resumedFrom, FakeTransferClient::tokenFor(99));
    EXPECT_FALSE(task("b1").resumeData);
}

TEST_F(DownloadManagerTest, ResumeIsIgnoredWhileOffline) {
    createManager();
    manager->enqueue({makeBlock("b1")});
    client.complete(client.last().handle, failure(TransferOutcome::NetworkError));

    connectivity.setAvailable(false);
    EXPECT_NO_THROW(manager->resumeDownloading());
    EXPECT_EQ(client.count(), 1u);
}

// -- Failures --

TEST_F(DownloadManagerTest, HttpErrorsAreRetriedThenDropped) {
    Config::instance().set<int>("downloads.maxAttempts", 2);
    createManager();
    manager->enqueue({makeBlock("b1"), makeBlock("b2")});
    writeFile(videoPath("b1.mp4"), "partial");

    client.complete(client.last().handle, failure(TransferOutcome::HttpError, 404));

    EXPECT_FALSE(fs::exists(videoPath("b1.mp4")));
    ASSERT_EQ(client.count(), 2u);
    EXPECT_EQ(client.last().url, "https://cdn.example.com/videos/b1.mp4");
    EXPECT_FALSE(client.last().resumedFrom);
    EXPECT_EQ(task("b1").state, DownloadState::InProgress);

    manager->waitForEvents();
    auto history = recorder.events();
    auto retried = std::find_if(history.begin(), history.end(),
        [](const DownloadEvent& e) { return e.type == Type::Finished; });
    ASSERT_NE(retried, history.end());
    ASSERT_TRUE(retried->task);
    EXPECT_EQ(retried->task->blockId, "b1");
    EXPECT_EQ(retried->task->state, DownloadState::Waiting);

    client.complete(client.last().handle, failure(TransferOutcome::HttpError, 404));

    ASSERT_EQ(tasks().size(), 1u);
    EXPECT_FALSE(store->getTask("b1"));
    EXPECT_EQ(task("b2").state, DownloadState::InProgress);
    ASSERT_EQ(client.count(), 3u);
    EXPECT_EQ(client.last().url, "https://cdn.example.com/videos/b2.mp4");

    manager->waitForEvents();
    auto events = recorder.events();
    auto canceled = std::find_if(events.begin(), events.end(),
        [](const DownloadEvent& e) { return e.type == Type::Canceled; });
    ASSERT_NE(canceled, events.end());
    ASSERT_EQ(canceled->tasks.size(), 1u);
    EXPECT_EQ(canceled->tasks[0].blockId, "b1");
}

TEST_F(DownloadManagerTest, SuccessResetsFailureCount) {
    Config::instance().set<int>("downloads.maxAttempts", 2);
    createManager();
    manager->enqueue({makeBlock("b1")});

    client.complete(client.last().handle, failure(TransferOutcome::IoError));
    client.succeed(client.last().handle);

    EXPECT_EQ(task("b1").state, DownloadState::Finished);
    EXPECT_EQ(manager->state(), ManagerState::Idle);
}

TEST_F(DownloadManagerTest, UnavailableVideosFolderDropsTask) {
    // A regular file where the videos folder should be created
    writeFile(documents(), "not a directory");
    createManager();

    manager->enqueue({makeBlock("b1")});

    EXPECT_TRUE(tasks().empty());
    EXPECT_TRUE(store->getAllTasks(kUserId).empty());
    EXPECT_EQ(client.count(), 0u);
    EXPECT_EQ(manager->state(), ManagerState::Idle);
    EXPECT_THAT(eventTypes(), ElementsAre(Type::Added, Type::DeletedFile));
}

// -- Cancellation and deletion --

TEST_F(DownloadManagerTest, CancelRemovesRecordAndFile) {
    createManager();
    manager->enqueue({makeBlock("b1"), makeBlock("b2")});
    writeFile(videoPath("b2.mp4"), "data");

    manager->cancel(task("b2"));

    EXPECT_FALSE(fs::exists(videoPath("b2.mp4")));
    EXPECT_FALSE(store->getTask("b2"));
    ASSERT_EQ(tasks().size(), 1u);

    // The active transfer is untouched
    EXPECT_FALSE(client.last().cancelled);
    EXPECT_EQ(task("b1").state, DownloadState::InProgress);

    client.succeed(client.last().handle);
    manager->resumeDownloading();
    EXPECT_EQ(client.count(), 1u);

    manager->waitForEvents();
    auto events = recorder.events();
    auto deleted = std::find_if(events.begin(), events.end(),
        [](const DownloadEvent& e) { return e.type == Type::DeletedFile; });
    ASSERT_NE(deleted, events.end());
    EXPECT_THAT(deleted->blockIds, ElementsAre("b2"));
}

TEST_F(DownloadManagerTest, CancelActiveAbortsAndAdvances) {
    createManager();
    manager->enqueue({makeBlock("b1"), makeBlock("b2")});
    auto handle = client.last().handle;

    manager->cancel(task("b1"));

    EXPECT_TRUE(client.get(handle).cancelled);
    EXPECT_FALSE(client.get(handle).suspended);
    ASSERT_EQ(client.count(), 2u);
    EXPECT_EQ(client.last().url, "https://cdn.example.com/videos/b2.mp4");

    // The aborted transfer reports late; nothing changes
    client.complete(handle, failure(TransferOutcome::Cancelled));
    EXPECT_EQ(task("b2").state, DownloadState::InProgress);
    EXPECT_EQ(manager->state(), ManagerState::Downloading);
}

TEST_F(DownloadManagerTest, CancelAllRemovesUnfinishedTasks) {
    createManager();
    manager->enqueue({makeBlock("b0")});
    client.succeed(client.last().handle);

    manager->enqueue({makeBlock("b1"), makeBlock("b2"), makeBlock("b3")});
    auto handle = client.last().handle;
    for (const auto& name : {"b0.mp4", "b1.mp4", "b2.mp4", "b3.mp4"}) {
        writeFile(videoPath(name), "data");
    }
    recorder.clear();

    manager->cancelAll();

    EXPECT_TRUE(client.get(handle).cancelled);
    EXPECT_EQ(manager->state(), ManagerState::Idle);
    EXPECT_FALSE(manager->currentTask());

    auto remaining = tasks();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].blockId, "b0");
    EXPECT_EQ(store->getAllTasks(kUserId).size(), 1u);
    EXPECT_TRUE(fs::exists(videoPath("b0.mp4")));
    EXPECT_FALSE(fs::exists(videoPath("b1.mp4")));
    EXPECT_FALSE(fs::exists(videoPath("b2.mp4")));
    EXPECT_FALSE(fs::exists(videoPath("b3.mp4")));

    EXPECT_THAT(eventTypes(), ElementsAre(Type::DeletedFile, Type::AllCanceled));
    EXPECT_THAT(recorder.events()[0].blockIds, UnorderedElementsAre("b1", "b2", "b3"));
}

TEST_F(DownloadManagerTest, CancelForCourseLeavesOtherCourses) {
    createManager();
    manager->enqueue({makeBlock("a1", "course-a"), makeBlock("b1", "course-b"), makeBlock("a2", "course-a")});
    auto handle = client.last().handle;
    recorder.clear();

    manager->cancelForCourse("course-a");

    EXPECT_TRUE(client.get(handle).cancelled);
    auto remaining = tasks();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].blockId, "b1");
    EXPECT_EQ(remaining[0].state, DownloadState::InProgress);
    EXPECT_TRUE(manager->listTasksForCourse("course-a").empty());

    manager->waitForEvents();
    auto events = recorder.events();
    auto courseCanceled = std::find_if(events.begin(), events.end(),
        [](const DownloadEvent& e) { return e.type == Type::CourseCanceled; });
    ASSERT_NE(courseCanceled, events.end());
    EXPECT_EQ(courseCanceled->courseId, "course-a");
}

TEST_F(DownloadManagerTest, CancelForCourseBlocksOnlyTouchesListedBlocks) {
    createManager();
    manager->enqueue({makeBlock("a1", "course-a"), makeBlock("a2", "course-a"), makeBlock("a3", "course-a")});
    auto handle = client.last().handle;

    manager->cancelForCourse("course-a", {makeBlock("a2", "course-a"), makeBlock("a3", "course-a")});

    EXPECT_FALSE(client.get(handle).cancelled);
    auto remaining = manager->listTasksForCourse("course-a");
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].blockId, "a1");

    // A partial cancel reports the removed files, not a course cancel
    EXPECT_THAT(eventTypes(), ElementsAre(Type::Added, Type::Started, Type::DeletedFile));
    EXPECT_THAT(recorder.events().back().blockIds, UnorderedElementsAre("a2", "a3"));
}

TEST_F(DownloadManagerTest, DeleteBlocksRemovesFinishedDownload) {
    createManager();
    manager->enqueue({makeBlock("b1"), makeBlock("b2")});
    client.succeed(client.last().handle);
    writeFile(videoPath("b1.mp4"), "video");

    manager->deleteBlocks({makeBlock("b1")}, "course-1");

    EXPECT_FALSE(fs::exists(videoPath("b1.mp4")));
    EXPECT_FALSE(manager->fileUrl("b1"));
    EXPECT_FALSE(store->getTask("b1"));
    EXPECT_EQ(task("b2").state, DownloadState::InProgress);
}

TEST_F(DownloadManagerTest, DeleteAllClearsEverything) {
    createManager();
    manager->enqueue({makeBlock("b1"), makeBlock("b2")});
    client.succeed(client.last().handle);
    auto handle = client.last().handle;
    recorder.clear();

    manager->deleteAll();

    EXPECT_TRUE(client.get(handle).cancelled);
    EXPECT_TRUE(tasks().empty());
    EXPECT_TRUE(store->getAllTasks(kUserId).empty());
    EXPECT_EQ(manager->state(), ManagerState::Idle);
    EXPECT_THAT(eventTypes(), ElementsAre(Type::DeletedFile, Type::ClearedAll));
}

TEST_F(DownloadManagerTest, QueueSizeFollowsQueue) {
    createManager();
    manager->enqueue({makeBlock("b1"), makeBlock("b2")});
    manager->cancelAll();

    auto history = sizes();
    ASSERT_FALSE(history.empty());
    EXPECT_EQ(history.front(), 2u);
    EXPECT_EQ(history.back(), 0u);
}

// -- Restarts --

TEST_F(DownloadManagerTest, InterruptedTaskIsResumedOnStartup) {
    store->setActiveUser(kUserId);
    store->upsertTasksFromBlocks({makeBlock("b1"), makeBlock("b2")}, models::DownloadQuality::Auto);
    store->updateState("7_b1", DownloadState::Finished, std::nullopt);
    store->updateState("7_b2", DownloadState::InProgress, std::nullopt);

    createManager();

    ASSERT_EQ(client.count(), 1u);
    EXPECT_EQ(client.last().url, "https://cdn.example.com/videos/b2.mp4");
    EXPECT_EQ(manager->state(), ManagerState::Downloading);
    EXPECT_EQ(inProgressCount(), 1u);
    EXPECT_TRUE(manager->fileUrl("b1"));
}

TEST_F(DownloadManagerTest, ShutdownPersistsResumeToken) {
    createManager();
    manager->enqueue({makeBlock("b1")});
    auto handle = client.last().handle;

    manager.reset();

    EXPECT_TRUE(client.get(handle).suspended);
    auto persisted = store->getTask("b1");
    ASSERT_TRUE(persisted);
    EXPECT_EQ(persisted->state, DownloadState::Waiting);
    EXPECT_EQ(persisted->resumeData, FakeTransferClient::tokenFor(handle));

    // Callbacks after destruction are dropped
    EXPECT_NO_THROW(client.succeed(handle));

    createManager();
    ASSERT_EQ(client.count(), 2u);
    EXPECT_EQ(client.last().resumedFrom, FakeTransferClient::tokenFor(handle));
}

TEST_F(DownloadManagerTest, TasksOfOtherUsersAreNotLoaded) {
    store->setActiveUser(42);
    store->upsertTasksFromBlocks({makeBlock("other")}, models::DownloadQuality::Auto);

    createManager();

    EXPECT_TRUE(tasks().empty());
    EXPECT_EQ(client.count(), 0u);
    EXPECT_EQ(store->getAllTasks(42).size(), 1u);
}

// -- Queries --

TEST_F(DownloadManagerTest, LargeVideosThresholdIsOneGibibyte) {
    createManager();
    constexpr int64_t MiB = 1024 * 1024;

    EXPECT_TRUE(manager->isLargeVideosSize({
        makeBlock("b1", "c", 614 * MiB),
        makeBlock("b2", "c", 615 * MiB)
    }));
    EXPECT_FALSE(manager->isLargeVideosSize({
        makeBlock("b1", "c", 450 * MiB),
        makeBlock("b2", "c", 450 * MiB)
    }));
    EXPECT_FALSE(manager->isLargeVideosSize({makeBlock("b1", "c", 1024 * MiB)}));
    EXPECT_FALSE(manager->isLargeVideosSize({}));
}

TEST_F(DownloadManagerTest, LargeVideosUsesConfiguredQuality) {
    constexpr int64_t MiB = 1024 * 1024;
    auto block = makeBlock("b1", "c", 100 * MiB);
    models::VideoSource hd;
    hd.url = "https://cdn.example.com/videos/b1-hd.mp4";
    hd.fileSize = 1200 * MiB;
    block.encodedVideo->desktopMp4 = hd;

    createManager();
    EXPECT_FALSE(manager->isLargeVideosSize({block}));

    Config::instance().set<std::string>("downloads.quality", "720p");
    EXPECT_TRUE(manager->isLargeVideosSize({block}));
}

TEST_F(DownloadManagerTest, RemovesLegacyCacheFolders) {
    fs::create_directories(dir.path() / "support" / "0123456789abcdef0123456789ABCDEF");
    fs::create_directories(dir.path() / "support" / "keep-me");
    createManager();

    EXPECT_EQ(manager->removeAppSupportDirectoryUnusedContent(), 1u);
    EXPECT_TRUE(fs::exists(dir.path() / "support" / "keep-me"));
}

TEST_F(DownloadManagerTest, UnsubscribingEventsKeepsQueueSizeHandler) {
    createManager();

    manager->unsubscribe(subscription);
    manager->enqueue({makeBlock("b1"), makeBlock("b2")});

    EXPECT_THAT(sizes(), ElementsAre(2u));
    EXPECT_TRUE(recorder.events().empty());
}

TEST_F(DownloadManagerTest, UnsubscribingQueueSizeKeepsEventHandler) {
    createManager();

    manager->unsubscribeQueueSize(queueSizeSubscription);
    manager->enqueue({makeBlock("b1")});

    EXPECT_TRUE(sizes().empty());
    EXPECT_THAT(eventTypes(), ElementsAre(Type::Added, Type::Started));
}

TEST_F(DownloadManagerTest, EnqueueSkipsBlocksWhoseIdIsNotAFileName) {
    writeFile(dir.path() / "victim.mp4", "keep");
    createManager();

    EXPECT_EQ(manager->enqueue({makeBlock("../../victim"), makeBlock("a/b"), makeBlock("b1")}), 1u);

    ASSERT_EQ(tasks().size(), 1u);
    EXPECT_EQ(tasks()[0].blockId, "b1");
    ASSERT_EQ(client.count(), 1u);
    EXPECT_EQ(client.last().destination, videoPath("b1.mp4"));

    manager->deleteAll();
    EXPECT_TRUE(fs::exists(dir.path() / "victim.mp4"));
}

TEST_F(DownloadManagerTest, StoredFileNameOutsideVideosFolderIsNeverTouched) {
    writeFile(dir.path() / "victim.mp4", "keep");
    writeFile(dir.path() / "data" / "downloads.json", R"({
        "version": 1,
        "tasks": [{
            "id": "7_x", "courseId": "course-1", "blockId": "x", "userId": 7,
            "url": "https://cdn.example.com/videos/x.mp4",
            "fileName": "../../victim.mp4", "state": "finished"
        }]
    })");
    store = std::make_unique<JsonTaskStore>(dir.path() / "data" / "downloads.json");
    createManager();

    EXPECT_FALSE(manager->fileUrl("x"));

    manager->deleteAll();
    EXPECT_TRUE(fs::exists(dir.path() / "victim.mp4"));
}

TEST_F(DownloadManagerTest, FileUrlDoesNotCreateVideosFolder) {
    store->setActiveUser(kUserId);
    store->upsertTasksFromBlocks({makeBlock("b1")}, models::DownloadQuality::Auto);
    store->updateState("7_b1", DownloadState::Finished, std::nullopt);
    createManager();

    auto url = manager->fileUrl("b1");

    ASSERT_TRUE(url);
    EXPECT_EQ(*url, videoPath("b1.mp4"));
    EXPECT_FALSE(fs::exists(documents() / "7_Files"));
}

TEST_F(DownloadManagerTest, ConcurrentCallersNeverRunTwoTransfers) {
    createManager();
    constexpr int kRounds = 200;
    std::atomic<bool> done{false};
    std::atomic<size_t> maxInProgress{0};

    auto blockFor = [](int i) {
        return makeBlock("b" + std::to_string(i % 12), i % 2 ? "course-a" : "course-b");
    };

    std::thread enqueuer([&] {
        for (int i = 0; i < kRounds; ++i) {
            try {
                manager->enqueue({blockFor(i), blockFor(i + 5)});
            } catch (const NoNetworkAccessError&) {
                // Offline at that moment
            }
        }
    });

    std::thread canceller([&] {
        for (int i = 0; i < kRounds; ++i) {
            try {
                if (i % 50 == 0) {
                    manager->cancelAll();
                } else if (i % 20 == 0) {
                    manager->cancelForCourse("course-b");
                } else if (i % 3 == 0) {
                    auto all = manager->listTasks();
                    if (!all.empty()) {
                        manager->cancel(all[static_cast<size_t>(i) % all.size()]);
                    }
                } else {
                    manager->cancelForCourse("course-a", {blockFor(i)});
                }
            } catch (const NoNetworkAccessError&) {
                // Offline at that moment
            }
        }
    });

    std::thread signaller([&] {
        for (int i = 0; i < kRounds; ++i) {
            switch (i % 5) {
                case 0: connectivity.goOffline(); break;
                case 1: connectivity.goOnline(); break;
                case 2: lifecycle.send(LifecycleEvent::EnteredBackground); break;
                case 3: lifecycle.send(LifecycleEvent::BecameActive); break;
                default:
                    try {
                        manager->resumeDownloading();
                    } catch (const NoNetworkAccessError&) {
                        // Offline at that moment
                    }
                    break;
            }
        }
    });

    // Plays the transfer worker: finishes whatever is running
    std::thread completer([&] {
        int n = 0;
        while (!done) {
            for (auto handle : client.liveHandles()) {
                if (++n % 4 == 0) {
                    client.complete(handle, failure(TransferOutcome::NetworkError));
                } else {
                    client.succeed(handle);
                }
            }
            std::this_thread::yield();
        }
    });

    std::thread watcher([&] {
        while (!done) {
            auto current = inProgressCount();
            auto seen = maxInProgress.load();
            while (current > seen && !maxInProgress.compare_exchange_weak(seen, current)) {}
            std::this_thread::yield();
        }
    });

    enqueuer.join();
    canceller.join();
    signaller.join();
    done = true;
    completer.join();
    watcher.join();
    manager->waitForEvents();

    EXPECT_LE(maxInProgress.load(), 1u);
    EXPECT_LE(client.maxLive(), 1u);
    EXPECT_LE(client.liveHandles().size(), 1u);
    EXPECT_LE(inProgressCount(), 1u);
    if (manager->state() == ManagerState::Downloading) {
        ASSERT_TRUE(manager->currentTask());
        EXPECT_EQ(manager->currentTask()->state, DownloadState::InProgress);
    }
}

} // namespace
} // namespace lectern::test
