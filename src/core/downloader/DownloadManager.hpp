#pragma once

/**
 * DownloadManager.hpp
 *
 * Tracks in-flight transfers, keeps them in sync with the transfer engine
 * and hands finished artifacts to the post-processing pipeline.
 */

#include "ArtifactPipeline.hpp"
#include "ArtifactStore.hpp"
#include "Download.hpp"
#include "DownloadSettings.hpp"
#include "TransferEngine.hpp"
#include "../EventBus.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hauler::core::downloader {

// Event names published on the EventBus. Payloads carry snapshot JSON.
inline constexpr const char* kEventDownloadAdded = "download.added";
inline constexpr const char* kEventDownloadUpdated = "download.updated";
inline constexpr const char* kEventDownloadRemoved = "download.removed";
inline constexpr const char* kEventDownloadFailed = "download.failed";
inline constexpr const char* kEventDownloadsReconciled = "downloads.reconciled";

/**
 * DownloadManager - owner of the download collection
 *
 * Engine events arrive on engine threads and are funneled onto a single
 * worker (the main sequence) before they touch the collection. Public
 * mutating calls apply their change under the same collection lock, so
 * there is exactly one writer at a time. Observers only ever receive
 * snapshots, and EventBus notifications are emitted from the main
 * sequence after the lock is released.
 *
 * None of the public calls wait for the network.
 */
class DownloadManager {
public:
    using CompletionHandler = std::function<void()>;

    DownloadManager(std::shared_ptr<TransferEngine> engine,
                    DownloadSettings settings,
                    EventBus& events,
                    std::shared_ptr<ArtifactPipeline> pipeline = nullptr,
                    std::shared_ptr<FailureFeedback> feedback = nullptr);

    ~DownloadManager();

    // Disable copy
    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    /**
     * Attach to the engine. Events the engine queued while nobody was
     * listening are delivered right after this call.
     */
    void initialize();

    /**
     * Detach from the engine and drain pending work. Transfers keep
     * running inside the engine.
     */
    void shutdown();

    /**
     * Start downloading url. A record that already tracks the same url is
     * resumed and returned instead of creating a second one.
     * @param url Source url
     * @param id Record id (generated when empty)
     */
    DownloadSnapshot startDownload(const std::string& url, const std::string& id = "");

    /**
     * Track an archive-only unit. It never gets a network handle; the
     * caller reports progress with setUnpackProgress() and finishes it with
     * removeDownload().
     */
    DownloadSnapshot startArchive(const std::string& url, const std::string& id = "");

    /**
     * Resume a record from its continuation data, a suspended handle, or by
     * re-issuing the original request, in that order of preference.
     * @return NoResumeDataAvailable if none of these is possible
     */
    MaybeError resumeDownload(const std::string& id);

    /**
     * Stop the transfer of a record but keep the record, with continuation
     * data when the engine can produce it. A resume requested before the
     * engine has handed back that data continues from it once it arrives.
     */
    MaybeError pauseDownload(const std::string& id);

    /**
     * Cancel the transfer (best effort) and drop the record right away.
     * @return false if no record has this id
     */
    bool cancelDownload(const std::string& id);

    /**
     * Drop a record without touching its transfer
     */
    bool removeDownload(const std::string& id);

    /**
     * Unpack phase progress for a record, clamped to [0,1], never decreasing
     */
    bool setUnpackProgress(const std::string& id, double progress);

    void pauseAll();
    void resumeAll();

    /**
     * Re-synchronize with the engine's live tasks: refresh records that own
     * a task, adopt tasks nobody owns. Idempotent.
     */
    void reconcile();

    /**
     * One-shot callback run once the engine reports that every queued
     * background event was delivered.
     */
    void setBackgroundCompletionHandler(CompletionHandler handler);

    bool isBackgroundDownloadSupported() const;

    // Queries (snapshots; safe from any thread)
    std::optional<DownloadSnapshot> getDownload(const std::string& id) const;
    std::optional<size_t> getDownloadIndex(const std::string& id) const;
    std::optional<DownloadSnapshot> getDownloadByTask(uint64_t taskIdentifier) const;
    std::vector<DownloadSnapshot> downloads() const;
    std::vector<DownloadSnapshot> manualDownloads() const;
    bool isManualDownload(const std::string& id) const;
    size_t size() const;

    /**
     * Block until the main sequence and the pipeline workers are idle.
     * Must not be called from an event subscriber or a pipeline.
     */
    void waitForIdle();

    const DownloadSettings& settings() const { return m_settings; }

private:
    using DownloadPtr = std::unique_ptr<Download>;
    using DownloadList = std::vector<DownloadPtr>;

    // Collection helpers; callers hold m_mutex
    DownloadList::iterator findLocked(const std::string& id);
    DownloadList::const_iterator findLocked(const std::string& id) const;
    DownloadList::iterator findByUrlLocked(const std::string& url);
    DownloadList::iterator findByTaskLocked(uint64_t taskIdentifier);
    std::string uniqueIdLocked(const std::string& requested) const;
    MaybeError resumeLocked(Download& download);
    bool issueFreshTaskLocked(Download& download);
    void releaseTaskLocked(Download& download, std::optional<ResumeData> resumeData);

    /**
     * Entry point onto the main sequence. Callbacks that may outlive the
     * manager hold the gate, not the manager; a closed gate drops work.
     */
    struct MainSequenceGate {
        std::mutex mutex;
        ThreadPool* queue{nullptr};
    };
    using GatePtr = std::shared_ptr<MainSequenceGate>;

    static bool postThrough(const GatePtr& gate, std::function<void()> work);

    // Main sequence
    void post(std::function<void()> work);
    void publish(const std::string& event, nlohmann::json payload);
    void handleEvent(const TransferEvent& event);
    void handleProgress(const TransferEvent& event);
    void handleFinished(const TransferEvent& event);
    void handleFailed(const TransferEvent& event);
    void handleEventsDelivered();
    void applyReconcile(const std::vector<TransferTaskPtr>& tasks);
    void applyPausedTask(const std::string& id, uint64_t taskIdentifier,
                         std::optional<ResumeData> resumeData);

    // Hand-off
    void runPipeline(const std::filesystem::path& artifact, const DownloadSnapshot& download,
                     uint64_t taskIdentifier);
    void finishHandoff(const std::string& id, uint64_t taskIdentifier, const MaybeError& pipelineError);

private:
    std::shared_ptr<TransferEngine> m_engine;
    DownloadSettings m_settings;
    EventBus& m_events;
    std::shared_ptr<ArtifactPipeline> m_pipeline;
    std::shared_ptr<FailureFeedback> m_feedback;
    ArtifactStore m_store;

    DownloadList m_downloads;
    mutable std::mutex m_mutex;

    CompletionHandler m_backgroundCompletionHandler;
    std::mutex m_handlerMutex;

    GatePtr m_gate;
    std::unique_ptr<ThreadPool> m_mainQueue;
    std::unique_ptr<ThreadPool> m_workPool;

    std::atomic<bool> m_initialized{false};
};

} // namespace hauler::core::downloader
