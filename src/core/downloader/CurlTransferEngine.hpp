#pragma once

/**
 * CurlTransferEngine.hpp
 *
 * TransferEngine backed by cpr/libcurl. Transfers run on a worker pool,
 * write into part files inside the session directory and survive process
 * restarts through the session journal.
 */

#include "DownloadSettings.hpp"
#include "SessionJournal.hpp"
#include "TransferEngine.hpp"
#include "../ThreadPool.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hauler::core::downloader {

class CurlTransferEngine;

/**
 * CurlTransferTask - handle for one HTTP(S)/FTP transfer
 */
class CurlTransferTask : public TransferTask,
                         public std::enable_shared_from_this<CurlTransferTask> {
public:
    CurlTransferTask(std::weak_ptr<CurlTransferEngine> engine,
                     uint64_t identifier,
                     std::string url,
                     std::filesystem::path partFile);

    uint64_t identifier() const override { return m_identifier; }
    std::string originalUrl() const override { return m_url; }
    TransferState state() const override;
    int64_t bytesReceived() const override { return m_bytesReceived.load(); }
    int64_t bytesExpected() const override { return m_bytesExpected.load(); }
    std::string suggestedFilename() const override;

    void resume() override;
    void suspend() override;
    void cancel() override;
    void cancelByProducingResumeData(
        std::function<void(std::optional<ResumeData>)> completion) override;

    const std::filesystem::path& partFile() const { return m_partFile; }

private:
    friend class CurlTransferEngine;

    // Checked by the transfer callbacks; false aborts the request
    bool shouldContinue() const;

    JournalEntry journalEntry() const;
    void requestCancel(bool produceResumeData,
                       std::function<void(std::optional<ResumeData>)> completion);

    std::weak_ptr<CurlTransferEngine> m_engine;
    const uint64_t m_identifier;
    const std::string m_url;
    const std::filesystem::path m_partFile;

    mutable std::mutex m_mutex;
    TransferState m_state{TransferState::Suspended};
    bool m_active{false};           // a pool worker owns the request
    bool m_produceResumeData{false};
    std::function<void(std::optional<ResumeData>)> m_resumeCompletion;
    std::string m_etag;
    std::string m_lastModified;
    std::string m_suggestedFilename;

    std::atomic<int64_t> m_bytesReceived{0};
    std::atomic<int64_t> m_bytesExpected{0};
};

/**
 * CurlTransferEngine
 *
 * Create it with create(); tasks keep a weak reference back to the engine.
 * Events raised while no sink is attached are queued (progress is dropped,
 * reconcile() recovers it) and flushed when a sink attaches. A finished
 * transfer stays in the journal until its Finished event reached a sink, so
 * one that finishes while detached is re-delivered after a restart.
 */
class CurlTransferEngine : public TransferEngine,
                           public std::enable_shared_from_this<CurlTransferEngine> {
public:
    /**
     * Open the session in settings.sessionDirectory and re-attach the tasks
     * recorded in its journal. Tasks that were running are started again.
     */
    static std::shared_ptr<CurlTransferEngine> create(DownloadSettings settings);

    ~CurlTransferEngine() override;

    CurlTransferEngine(const CurlTransferEngine&) = delete;
    CurlTransferEngine& operator=(const CurlTransferEngine&) = delete;

    TransferTaskPtr createTask(const std::string& url) override;
    TransferTaskPtr createTask(const ResumeData& resumeData) override;

    /**
     * Delete the part file the data refers to. Files outside the session
     * directory are left alone.
     */
    void discardResumeData(const ResumeData& resumeData) override;

    void getAllTasks(TaskListCallback callback) override;
    void setEventSink(TransferEventSink sink) override;

    // The session journal keeps transfers across restarts
    bool supportsBackgroundTransfers() const override { return true; }

    const std::filesystem::path& sessionDirectory() const { return m_settings.sessionDirectory; }

private:
    explicit CurlTransferEngine(DownloadSettings settings);

    friend class CurlTransferTask;

    /**
     * Outcome of one request
     */
    struct Attempt {
        bool aborted{false};
        long statusCode{0};
        std::string error;
    };

    void restoreSession();
    void restoreFinished(const JournalEntry& entry);
    std::shared_ptr<CurlTransferTask> makeTask(uint64_t identifier, const std::string& url);
    std::filesystem::path partFileFor(uint64_t identifier) const;

    // Called by tasks
    void schedule(const std::shared_ptr<CurlTransferTask>& task);
    void persist(const CurlTransferTask& task);
    void finishCancel(const std::shared_ptr<CurlTransferTask>& task);

    // Pool workers
    void runTransfer(const std::shared_ptr<CurlTransferTask>& task);
    Attempt performRequest(const std::shared_ptr<CurlTransferTask>& task);
    void finishSuccess(const std::shared_ptr<CurlTransferTask>& task);
    void finishFailure(const std::shared_ptr<CurlTransferTask>& task, const std::string& reason);

    void forget(uint64_t identifier);
    void emit(TransferEvent event);
    void deliverLocked(TransferEvent event);

private:
    DownloadSettings m_settings;
    SessionJournal m_journal;

    std::map<uint64_t, std::shared_ptr<CurlTransferTask>> m_tasks;
    std::mutex m_tasksMutex;

    TransferEventSink m_sink;
    std::vector<TransferEvent> m_pendingEvents;
    std::mutex m_sinkMutex;

    std::atomic<bool> m_closing{false};
    std::unique_ptr<ThreadPool> m_pool;
};

} // namespace hauler::core::downloader
