/**
 * Download.cpp
 *
 * Record state transitions and snapshot serialization.
 */

#include "Download.hpp"
#include "../../utils/UrlUtils.hpp"

#include <algorithm>

namespace hauler::core::downloader {

namespace {

double clampUnit(double value) {
    if (!(value >= 0.0)) return 0.0; // also catches NaN
    return std::min(value, 1.0);
}

} // namespace

nlohmann::json DownloadSnapshot::toJson() const {
    return {
        {"id", id},
        {"url", url},
        {"fileName", fileName},
        {"archiveOnly", archiveOnly},
        {"downloadProgress", downloadProgress},
        {"bytesDownloaded", bytesDownloaded},
        {"totalBytes", totalBytes},
        {"unpackProgress", unpackProgress},
        {"overallProgress", overallProgress()},
        {"hasActiveTask", hasActiveTask},
        {"hasResumeData", hasResumeData}
    };
}

Download::Download(std::string id, std::string url, bool archiveOnly)
    : m_id(std::move(id))
    , m_url(std::move(url))
    , m_fileName(utils::UrlUtils::lastPathComponent(m_url))
    , m_archiveOnly(archiveOnly) {
}

bool Download::applyTransferProgress(int64_t totalBytesWritten, int64_t totalBytesExpected) {
    double progress = totalBytesExpected > 0
        ? static_cast<double>(totalBytesWritten) / static_cast<double>(totalBytesExpected)
        : 0.0;
    progress = std::max(m_downloadProgress, clampUnit(progress));

    bool changed = progress != m_downloadProgress
        || totalBytesWritten != m_bytesDownloaded
        || totalBytesExpected != m_totalBytes;

    m_downloadProgress = progress;
    m_bytesDownloaded = std::max<int64_t>(0, totalBytesWritten);
    m_totalBytes = std::max<int64_t>(0, totalBytesExpected);
    return changed;
}

bool Download::refreshFrom(const TransferTask& task) {
    bool changed = applyTransferProgress(task.bytesReceived(), task.bytesExpected());

    // A task may know it is done before its size is known
    double fraction = clampUnit(task.fractionCompleted());
    if (fraction > m_downloadProgress) {
        m_downloadProgress = fraction;
        changed = true;
    }
    return changed;
}

bool Download::setUnpackProgress(double progress) {
    double next = std::max(m_unpackProgress, clampUnit(progress));
    if (next == m_unpackProgress) return false;
    m_unpackProgress = next;
    return true;
}

void Download::restartDownloadPhase() {
    m_downloadProgress = 0.0;
    m_bytesDownloaded = 0;
    m_totalBytes = 0;
}

bool Download::setTask(TransferTaskPtr task) {
    if (m_archiveOnly && task) {
        return false;
    }
    m_task = std::move(task);
    return true;
}

bool Download::releaseTask() {
    if (m_task) {
        m_releasedTask = m_task->identifier();
    }
    m_task.reset();

    bool resume = m_pausePending && m_resumeRequested;
    m_pausePending = false;
    m_resumeRequested = false;
    return resume;
}

DownloadSnapshot Download::snapshot() const {
    DownloadSnapshot snap;
    snap.id = m_id;
    snap.url = m_url;
    snap.fileName = m_fileName;
    snap.archiveOnly = m_archiveOnly;
    snap.downloadProgress = m_downloadProgress;
    snap.bytesDownloaded = m_bytesDownloaded;
    snap.totalBytes = m_totalBytes;
    snap.unpackProgress = m_unpackProgress;
    snap.hasActiveTask = static_cast<bool>(m_task);
    snap.hasResumeData = m_resumeData.has_value();
    return snap;
}

} // namespace hauler::core::downloader
