#pragma once

/**
 * Download.hpp
 *
 * State of a single tracked transfer and the immutable snapshot handed to
 * observers.
 */

#include "TransferTask.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace hauler::core::downloader {

// Share of the overall progress taken by each phase of a network download
inline constexpr double kDownloadPhaseWeight = 0.7;
inline constexpr double kUnpackPhaseWeight = 0.3;

/**
 * Composite progress of a record: the unpack phase alone for archive-only
 * units, the weighted sum of both phases otherwise.
 */
inline double compositeProgress(bool archiveOnly, double downloadProgress, double unpackProgress) {
    return archiveOnly
        ? unpackProgress
        : kDownloadPhaseWeight * downloadProgress + kUnpackPhaseWeight * unpackProgress;
}

/**
 * DownloadSnapshot - value copy of a record's observable fields
 */
struct DownloadSnapshot {
    std::string id;
    std::string url;
    std::string fileName;
    bool archiveOnly{false};

    double downloadProgress{0.0};
    int64_t bytesDownloaded{0};
    int64_t totalBytes{0};
    double unpackProgress{0.0};

    bool hasActiveTask{false};
    bool hasResumeData{false};

    double overallProgress() const {
        return compositeProgress(archiveOnly, downloadProgress, unpackProgress);
    }

    nlohmann::json toJson() const;
};

/**
 * Download - mutable record owned by the DownloadManager
 *
 * Not synchronized; the manager only touches records while holding its
 * collection lock.
 */
class Download {
public:
    Download(std::string id, std::string url, bool archiveOnly = false);

    const std::string& id() const { return m_id; }
    const std::string& url() const { return m_url; }
    const std::string& fileName() const { return m_fileName; }
    bool archiveOnly() const { return m_archiveOnly; }

    double downloadProgress() const { return m_downloadProgress; }
    int64_t bytesDownloaded() const { return m_bytesDownloaded; }
    int64_t totalBytes() const { return m_totalBytes; }
    double unpackProgress() const { return m_unpackProgress; }

    double overallProgress() const {
        return compositeProgress(m_archiveOnly, m_downloadProgress, m_unpackProgress);
    }

    /**
     * Apply a progress report from the transfer engine. Download progress
     * never moves backwards here; a restarted transfer goes through
     * restartDownloadPhase() first.
     * @return true if an observable field changed
     */
    bool applyTransferProgress(int64_t totalBytesWritten, int64_t totalBytesExpected);

    /**
     * Copy the counters of a live task (reconciliation)
     */
    bool refreshFrom(const TransferTask& task);

    /**
     * Unpack phase progress, clamped to [0,1] and never decreasing
     * @return true if the value changed
     */
    bool setUnpackProgress(double progress);

    /**
     * Forget download counters before a fresh re-issue of the request
     */
    void restartDownloadPhase();

    const TransferTaskPtr& task() const { return m_task; }

    /**
     * Attach the active handle, replacing any previous one.
     * @return false for archive-only records, which never get a handle
     */
    bool setTask(TransferTaskPtr task);
    bool hasTask(uint64_t identifier) const { return m_task && m_task->identifier() == identifier; }

    /**
     * A pause was requested; the handle is unwinding into resume data
     */
    void beginPause() {
        m_pausePending = true;
        m_resumeRequested = false;
    }
    bool pausePending() const { return m_pausePending; }

    // Resume once the pending pause has produced its data
    void requestResume() { m_resumeRequested = true; }

    /**
     * Drop the handle after it was paused or cancelled, ending any pending
     * pause.
     * @return true if a resume was requested while the pause was pending
     */
    bool releaseTask();

    // Whether identifier is the handle most recently dropped by releaseTask()
    bool wasReleased(uint64_t identifier) const {
        return m_releasedTask && *m_releasedTask == identifier;
    }

    const std::optional<ResumeData>& resumeData() const { return m_resumeData; }
    void setResumeData(ResumeData data) { m_resumeData = std::move(data); }
    void clearResumeData() { m_resumeData.reset(); }

    DownloadSnapshot snapshot() const;

private:
    const std::string m_id;
    const std::string m_url;
    const std::string m_fileName;
    const bool m_archiveOnly;

    double m_downloadProgress{0.0};
    int64_t m_bytesDownloaded{0};
    int64_t m_totalBytes{0};
    double m_unpackProgress{0.0};

    TransferTaskPtr m_task;
    std::optional<ResumeData> m_resumeData;

    bool m_pausePending{false};
    bool m_resumeRequested{false};
    std::optional<uint64_t> m_releasedTask;
};

} // namespace hauler::core::downloader
