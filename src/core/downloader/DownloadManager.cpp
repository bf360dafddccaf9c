/**
 * DownloadManager.cpp
 *
 * Implementation of the download collection and its engine bridge.
 */

#include "DownloadManager.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace hauler::core::downloader {

DownloadManager::DownloadManager(std::shared_ptr<TransferEngine> engine,
                                 DownloadSettings settings,
                                 EventBus& events,
                                 std::shared_ptr<ArtifactPipeline> pipeline,
                                 std::shared_ptr<FailureFeedback> feedback)
    : m_engine(std::move(engine))
    , m_settings(std::move(settings))
    , m_events(events)
    , m_pipeline(std::move(pipeline))
    , m_feedback(std::move(feedback))
    , m_store(m_settings.workDirectory)
    , m_gate(std::make_shared<MainSequenceGate>())
    , m_mainQueue(std::make_unique<ThreadPool>(1, "main"))
    , m_workPool(std::make_unique<ThreadPool>(2, "pipeline")) {

    if (!m_engine) {
        throw std::invalid_argument("DownloadManager requires a transfer engine");
    }

    std::lock_guard<std::mutex> lock(m_gate->mutex);
    m_gate->queue = m_mainQueue.get();
}

DownloadManager::~DownloadManager() {
    shutdown();

    // Late engine callbacks still hold the gate; close it before the pools go
    std::lock_guard<std::mutex> lock(m_gate->mutex);
    m_gate->queue = nullptr;
}

void DownloadManager::initialize() {
    if (m_initialized.exchange(true)) return;

    Logger::instance().info("Initializing DownloadManager (work directory: {})",
                            m_store.root().string());

    GatePtr gate = m_gate;
    m_engine->setEventSink([this, gate](TransferEvent event) {
        postThrough(gate, [this, event = std::move(event)] { handleEvent(event); });
    });
}

void DownloadManager::shutdown() {
    if (!m_initialized.exchange(false)) return;

    Logger::instance().info("Shutting down DownloadManager");

    m_engine->setEventSink(nullptr);
    waitForIdle();
}

// ============================================================================
// Collection helpers
// ============================================================================

DownloadManager::DownloadList::iterator DownloadManager::findLocked(const std::string& id) {
    return std::find_if(m_downloads.begin(), m_downloads.end(),
                        [&id](const DownloadPtr& d) { return d->id() == id; });
}

DownloadManager::DownloadList::const_iterator DownloadManager::findLocked(const std::string& id) const {
    return std::find_if(m_downloads.begin(), m_downloads.end(),
                        [&id](const DownloadPtr& d) { return d->id() == id; });
}

DownloadManager::DownloadList::iterator DownloadManager::findByUrlLocked(const std::string& url) {
    // Archive-only units are never matched by url; they have no transfer to resume
    return std::find_if(m_downloads.begin(), m_downloads.end(),
                        [&url](const DownloadPtr& d) { return !d->archiveOnly() && d->url() == url; });
}

DownloadManager::DownloadList::iterator DownloadManager::findByTaskLocked(uint64_t taskIdentifier) {
    return std::find_if(m_downloads.begin(), m_downloads.end(),
                        [taskIdentifier](const DownloadPtr& d) { return d->hasTask(taskIdentifier); });
}

std::string DownloadManager::uniqueIdLocked(const std::string& requested) const {
    if (!requested.empty()) {
        if (findLocked(requested) == m_downloads.end()) {
            return requested;
        }
        LOG_WARN("Download id '{}' is already in use, generating a new one", requested);
    }

    std::string id;
    do {
        id = utils::StringUtils::generateUUID();
    } while (findLocked(id) != m_downloads.end());
    return id;
}

bool DownloadManager::issueFreshTaskLocked(Download& download) {
    auto task = m_engine->createTask(download.url());
    if (!task) {
        LOG_ERROR("Transfer engine refused {}", download.url());
        return false;
    }

    if (const auto& previous = download.task()) {
        previous->cancel();
    }

    download.restartDownloadPhase();
    download.setTask(task);
    task->resume();

    LOG_DEBUG("Download {} re-issued as task {}", download.id(), task->identifier());
    return true;
}

MaybeError DownloadManager::resumeLocked(Download& download) {
    if (download.archiveOnly()) {
        return DownloadError::noResumeData("archive-only units have no transfer");
    }

    if (download.pausePending()) {
        // The paused handle is still unwinding; continue from its data
        download.requestResume();
        LOG_INFO("Download {} resumes once its pause completes", download.id());
        return std::nullopt;
    }

    if (download.resumeData()) {
        auto task = m_engine->createTask(*download.resumeData());
        download.clearResumeData();

        if (task) {
            if (const auto& previous = download.task()) {
                previous->cancel();
            }
            download.setTask(task);
            task->resume();
            LOG_INFO("Download {} resumed from continuation data", download.id());
            return std::nullopt;
        }
        LOG_WARN("Continuation data of {} is unusable, starting over", download.id());
    }

    if (const auto& task = download.task()) {
        switch (task->state()) {
            case TransferState::Running:
                return std::nullopt;
            case TransferState::Suspended:
                task->resume();
                LOG_INFO("Download {} resumed", download.id());
                return std::nullopt;
            case TransferState::Canceling:
            case TransferState::Completed:
                break;
        }
    }

    if (download.url().empty()) {
        return DownloadError::noResumeData("download has no source url");
    }

    if (!issueFreshTaskLocked(download)) {
        return DownloadError::transferFailed("transfer engine refused " + download.url());
    }
    return std::nullopt;
}

void DownloadManager::releaseTaskLocked(Download& download, std::optional<ResumeData> resumeData) {
    bool resume = download.releaseTask();
    if (resumeData && !resumeData->empty()) {
        download.setResumeData(std::move(*resumeData));
    }
    if (!resume) return;

    LOG_INFO("Download {} was resumed while pausing, continuing", download.id());
    if (auto error = resumeLocked(download)) {
        LOG_WARN("Could not resume {}: {}", download.id(), error->reason);
    }
}

// ============================================================================
// Public operations
// ============================================================================

DownloadSnapshot DownloadManager::startDownload(const std::string& url, const std::string& id) {
    enum class Outcome { Added, Existing, Refused };

    DownloadSnapshot snapshot;
    Outcome outcome = Outcome::Added;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto existing = findByUrlLocked(url);
        if (existing != m_downloads.end()) {
            Download& download = **existing;
            if (auto error = resumeLocked(download)) {
                LOG_WARN("Could not resume {}: {}", download.id(), error->reason);
            }
            snapshot = download.snapshot();
            outcome = Outcome::Existing;
        } else {
            auto download = std::make_unique<Download>(uniqueIdLocked(id), url);
            auto task = m_engine->createTask(url);

            if (!task) {
                snapshot = download->snapshot();
                outcome = Outcome::Refused;
            } else {
                download->setTask(task);
                task->resume();
                snapshot = download->snapshot();
                m_downloads.push_back(std::move(download));
            }
        }
    }

    if (outcome == Outcome::Refused) {
        auto error = DownloadError::transferFailed("transfer engine refused " + url);
        LOG_ERROR("Cannot start download {}: {}", snapshot.id, error.reason);
        publish(kEventDownloadFailed, {
            {"download", snapshot.toJson()},
            {"error", toString(error.code)},
            {"reason", error.reason}
        });
        return snapshot;
    }

    if (outcome == Outcome::Added) {
        LOG_INFO("Started download {} ({})", snapshot.id, url);
        publish(kEventDownloadAdded, snapshot.toJson());
    } else {
        publish(kEventDownloadUpdated, snapshot.toJson());
    }
    return snapshot;
}

DownloadSnapshot DownloadManager::startArchive(const std::string& url, const std::string& id) {
    DownloadSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto download = std::make_unique<Download>(uniqueIdLocked(id), url, true);
        snapshot = download->snapshot();
        m_downloads.push_back(std::move(download));
    }

    LOG_INFO("Tracking archive {} ({})", snapshot.id, snapshot.fileName);
    publish(kEventDownloadAdded, snapshot.toJson());
    return snapshot;
}

MaybeError DownloadManager::resumeDownload(const std::string& id) {
    DownloadSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findLocked(id);
        if (it == m_downloads.end()) {
            return DownloadError::noResumeData("no download with id " + id);
        }

        if (auto error = resumeLocked(**it)) {
            return error;
        }
        snapshot = (*it)->snapshot();
    }

    publish(kEventDownloadUpdated, snapshot.toJson());
    return std::nullopt;
}

MaybeError DownloadManager::pauseDownload(const std::string& id) {
    TransferTaskPtr task;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findLocked(id);
        if (it == m_downloads.end()) {
            return DownloadError::noResumeData("no download with id " + id);
        }

        task = (*it)->task();
        if (!task) {
            return DownloadError::noResumeData("download has no active transfer");
        }
        auto state = task->state();
        if (state == TransferState::Completed || state == TransferState::Canceling) {
            return DownloadError::noResumeData(std::string("transfer is ") + toString(state));
        }
        (*it)->beginPause();
    }

    uint64_t taskIdentifier = task->identifier();
    GatePtr gate = m_gate;
    task->cancelByProducingResumeData([this, gate, id, taskIdentifier](std::optional<ResumeData> data) {
        postThrough(gate, [this, id, taskIdentifier, data = std::move(data)] {
            applyPausedTask(id, taskIdentifier, data);
        });
    });

    LOG_INFO("Pausing download {}", id);
    return std::nullopt;
}

bool DownloadManager::cancelDownload(const std::string& id) {
    DownloadSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findLocked(id);
        if (it == m_downloads.end()) {
            return false;
        }

        if (const auto& task = (*it)->task()) {
            task->cancel();
        }
        snapshot = (*it)->snapshot();
        m_downloads.erase(it);
    }

    LOG_INFO("Cancelled download {}", id);
    publish(kEventDownloadRemoved, snapshot.toJson());
    return true;
}

bool DownloadManager::removeDownload(const std::string& id) {
    DownloadSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findLocked(id);
        if (it == m_downloads.end()) {
            return false;
        }
        snapshot = (*it)->snapshot();
        m_downloads.erase(it);
    }

    LOG_DEBUG("Removed download {}", id);
    publish(kEventDownloadRemoved, snapshot.toJson());
    return true;
}

bool DownloadManager::setUnpackProgress(const std::string& id, double progress) {
    DownloadSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findLocked(id);
        if (it == m_downloads.end()) {
            return false;
        }
        if (!(*it)->setUnpackProgress(progress)) {
            return true;
        }
        snapshot = (*it)->snapshot();
    }

    publish(kEventDownloadUpdated, snapshot.toJson());
    return true;
}

void DownloadManager::pauseAll() {
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t count = 0;
    for (const auto& download : m_downloads) {
        if (const auto& task = download->task()) {
            task->suspend();
            ++count;
        }
    }
    LOG_INFO("Suspended {} transfer(s)", count);
}

void DownloadManager::resumeAll() {
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t count = 0;
    for (const auto& download : m_downloads) {
        if (const auto& task = download->task()) {
            task->resume();
            ++count;
        }
    }
    LOG_INFO("Resumed {} transfer(s)", count);
}

void DownloadManager::reconcile() {
    LOG_DEBUG("Reconciling with transfer engine");

    GatePtr gate = m_gate;
    m_engine->getAllTasks([this, gate](std::vector<TransferTaskPtr> tasks) {
        postThrough(gate, [this, tasks = std::move(tasks)] { applyReconcile(tasks); });
    });
}

void DownloadManager::setBackgroundCompletionHandler(CompletionHandler handler) {
    std::lock_guard<std::mutex> lock(m_handlerMutex);
    m_backgroundCompletionHandler = std::move(handler);
}

bool DownloadManager::isBackgroundDownloadSupported() const {
    return m_engine->supportsBackgroundTransfers();
}

// ============================================================================
// Queries
// ============================================================================

std::optional<DownloadSnapshot> DownloadManager::getDownload(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = findLocked(id);
    if (it == m_downloads.end()) return std::nullopt;
    return (*it)->snapshot();
}

std::optional<size_t> DownloadManager::getDownloadIndex(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = findLocked(id);
    if (it == m_downloads.end()) return std::nullopt;
    return static_cast<size_t>(std::distance(m_downloads.begin(), it));
}

std::optional<DownloadSnapshot> DownloadManager::getDownloadByTask(uint64_t taskIdentifier) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& download : m_downloads) {
        if (download->hasTask(taskIdentifier)) {
            return download->snapshot();
        }
    }
    return std::nullopt;
}

std::vector<DownloadSnapshot> DownloadManager::downloads() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<DownloadSnapshot> result;
    result.reserve(m_downloads.size());
    for (const auto& download : m_downloads) {
        result.push_back(download->snapshot());
    }
    return result;
}

std::vector<DownloadSnapshot> DownloadManager::manualDownloads() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<DownloadSnapshot> result;
    for (const auto& download : m_downloads) {
        if (utils::StringUtils::contains(download->id(), m_settings.manualMarker)) {
            result.push_back(download->snapshot());
        }
    }
    return result;
}

bool DownloadManager::isManualDownload(const std::string& id) const {
    return utils::StringUtils::contains(id, m_settings.manualMarker);
}

size_t DownloadManager::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_downloads.size();
}

void DownloadManager::waitForIdle() {
    if (m_mainQueue->isWorkerThread() || m_workPool->isWorkerThread()) {
        LOG_ERROR("waitForIdle() called from a DownloadManager worker; ignoring");
        return;
    }

    // Pipelines post back onto the main sequence and vice versa
    do {
        m_workPool->waitAll();
        m_mainQueue->waitAll();
    } while (!m_workPool->isIdle() || !m_mainQueue->isIdle());
}

// ============================================================================
// Main sequence
// ============================================================================

bool DownloadManager::postThrough(const GatePtr& gate, std::function<void()> work) {
    std::lock_guard<std::mutex> lock(gate->mutex);
    if (!gate->queue) {
        LOG_DEBUG("DownloadManager is gone, dropping late callback");
        return false;
    }
    return gate->queue->post(std::move(work));
}

void DownloadManager::post(std::function<void()> work) {
    postThrough(m_gate, std::move(work));
}

void DownloadManager::publish(const std::string& event, nlohmann::json payload) {
    post([this, event, payload = std::move(payload)] {
        m_events.emit(event, payload);
    });
}

void DownloadManager::handleEvent(const TransferEvent& event) {
    switch (event.type) {
        case TransferEventType::Progress:
            handleProgress(event);
            break;
        case TransferEventType::Finished:
            handleFinished(event);
            break;
        case TransferEventType::Failed:
            handleFailed(event);
            break;
        case TransferEventType::EventsDelivered:
            handleEventsDelivered();
            break;
    }
}

void DownloadManager::handleProgress(const TransferEvent& event) {
    if (!event.task) return;

    DownloadSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findByTaskLocked(event.task->identifier());
        if (it == m_downloads.end()) {
            LOG_TRACE("Progress for untracked task {}", event.task->identifier());
            return;
        }

        Download& download = **it;
        bool changed = event.restarted;
        if (event.restarted) {
            LOG_DEBUG("Transfer of {} restarted from zero", download.id());
            download.restartDownloadPhase();
        }
        if (download.applyTransferProgress(event.totalBytesWritten, event.totalBytesExpected)) {
            changed = true;
        }
        if (!changed) {
            return;
        }
        snapshot = download.snapshot();
    }

    publish(kEventDownloadUpdated, snapshot.toJson());
}

void DownloadManager::handleFinished(const TransferEvent& event) {
    if (!event.task) return;

    uint64_t taskIdentifier = event.task->identifier();
    DownloadSnapshot snapshot;
    bool adopted = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findByTaskLocked(taskIdentifier);
        if (it == m_downloads.end() && event.recovered && !event.task->originalUrl().empty()) {
            // Finished while no process owned it; adopt it like reconcile() does
            auto download = std::make_unique<Download>(uniqueIdLocked(""), event.task->originalUrl());
            download->setTask(event.task);
            m_downloads.push_back(std::move(download));
            it = std::prev(m_downloads.end());
            adopted = true;
        }
        if (it == m_downloads.end()) {
            LOG_DEBUG("Discarding artifact of untracked task {}", taskIdentifier);
            std::error_code ec;
            utils::FileUtils::removeFileIfExists(event.location, ec);
            return;
        }
        (*it)->refreshFrom(*event.task);
        snapshot = (*it)->snapshot();
    }

    if (adopted) {
        LOG_INFO("Adopted finished transfer {} as download {}", snapshot.url, snapshot.id);
        publish(kEventDownloadAdded, snapshot.toJson());
    } else {
        publish(kEventDownloadUpdated, snapshot.toJson());
    }

    const std::string& fileName = event.suggestedFilename.empty()
        ? snapshot.fileName
        : event.suggestedFilename;

    DownloadError error;
    auto artifact = m_store.relocate(event.location, snapshot.id, fileName, error);
    if (!artifact) {
        // The record stays so the caller can see and retry it
        Logger::instance().error("Download {} finished but hand-off failed: {}",
                                 snapshot.id, error.reason);
        return;
    }

    Logger::instance().info("Download {} finished: {}", snapshot.id, artifact->string());

    if (!m_pipeline) {
        finishHandoff(snapshot.id, taskIdentifier, std::nullopt);
        return;
    }

    auto path = *artifact;
    if (!m_workPool->post([this, path, snapshot, taskIdentifier] {
            runPipeline(path, snapshot, taskIdentifier);
        })) {
        finishHandoff(snapshot.id, taskIdentifier,
                      DownloadError::pipelineFailed("pipeline workers are stopped"));
    }
}

void DownloadManager::handleFailed(const TransferEvent& event) {
    if (!event.task) return;

    DownloadError error = event.error ? *event.error
                                      : DownloadError::transferFailed("unknown transfer error");
    DownloadSnapshot snapshot;
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findByTaskLocked(event.task->identifier());
        if (it == m_downloads.end()) {
            LOG_DEBUG("Failure of untracked task {}: {}", event.task->identifier(), error.reason);
            return;
        }

        if (error.isCancellation()) {
            // Paused, or cancelled by the engine side; keep the record resumable
            releaseTaskLocked(**it, event.resumeData);
        } else {
            removed = true;
        }
        snapshot = (*it)->snapshot();
        if (removed) {
            m_downloads.erase(it);
        }
    }

    if (!removed) {
        LOG_INFO("Transfer of {} was cancelled", snapshot.id);
        publish(kEventDownloadUpdated, snapshot.toJson());
        return;
    }

    LOG_WARN("Download {} failed: {}", snapshot.id, error.reason);
    publish(kEventDownloadFailed, {
        {"download", snapshot.toJson()},
        {"error", toString(error.code)},
        {"reason", error.reason}
    });
    publish(kEventDownloadRemoved, snapshot.toJson());
}

void DownloadManager::handleEventsDelivered() {
    CompletionHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        handler = std::move(m_backgroundCompletionHandler);
        m_backgroundCompletionHandler = nullptr;
    }

    if (handler) {
        LOG_DEBUG("Background events delivered, running completion handler");
        handler();
    }
}

void DownloadManager::applyReconcile(const std::vector<TransferTaskPtr>& tasks) {
    std::vector<DownloadSnapshot> adopted;
    std::vector<DownloadSnapshot> refreshed;
    size_t total = 0;

    {
        std::lock_guard<std::mutex> lock(m_mutex);

        for (const auto& task : tasks) {
            if (!task) continue;

            auto it = findByTaskLocked(task->identifier());
            if (it != m_downloads.end()) {
                if (task->state() == TransferState::Running && (*it)->refreshFrom(*task)) {
                    refreshed.push_back((*it)->snapshot());
                }
                continue;
            }

            auto state = task->state();
            if (state == TransferState::Completed || state == TransferState::Canceling) {
                continue;
            }

            std::string url = task->originalUrl();
            if (url.empty()) {
                LOG_WARN("Skipping engine task {} without a source url", task->identifier());
                continue;
            }

            auto download = std::make_unique<Download>(uniqueIdLocked(""), url);
            download->setTask(task);
            if (state == TransferState::Running) {
                download->refreshFrom(*task);
            }
            adopted.push_back(download->snapshot());
            m_downloads.push_back(std::move(download));
        }
        total = m_downloads.size();
    }

    for (const auto& snapshot : adopted) {
        LOG_INFO("Adopted transfer {} as download {}", snapshot.url, snapshot.id);
        publish(kEventDownloadAdded, snapshot.toJson());
    }
    for (const auto& snapshot : refreshed) {
        publish(kEventDownloadUpdated, snapshot.toJson());
    }

    LOG_DEBUG("Reconcile done: {} adopted, {} refreshed, {} tracked",
              adopted.size(), refreshed.size(), total);
    publish(kEventDownloadsReconciled, {
        {"adopted", adopted.size()},
        {"refreshed", refreshed.size()},
        {"total", total}
    });
}

void DownloadManager::applyPausedTask(const std::string& id, uint64_t taskIdentifier,
                                      std::optional<ResumeData> resumeData) {
    DownloadSnapshot snapshot;
    bool orphaned = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findLocked(id);
        if (it == m_downloads.end()) {
            orphaned = true;
        } else if ((*it)->hasTask(taskIdentifier)) {
            releaseTaskLocked(**it, resumeData);
            snapshot = (*it)->snapshot();
        } else if ((*it)->wasReleased(taskIdentifier)) {
            // The cancellation event of this handle already settled the record
            return;
        } else {
            orphaned = true;
        }
    }

    if (orphaned) {
        // Nobody will continue from this data; let the engine free its part file
        if (resumeData && !resumeData->empty()) {
            LOG_DEBUG("Discarding continuation data of {}", id);
            m_engine->discardResumeData(*resumeData);
        }
        return;
    }

    if (snapshot.hasActiveTask) {
        LOG_INFO("Download {} continued after its pause", id);
    } else {
        LOG_INFO("Download {} paused ({})", id,
                 snapshot.hasResumeData ? "resumable" : "will restart");
    }
    publish(kEventDownloadUpdated, snapshot.toJson());
}

// ============================================================================
// Hand-off
// ============================================================================

void DownloadManager::runPipeline(const std::filesystem::path& artifact,
                                  const DownloadSnapshot& download,
                                  uint64_t taskIdentifier) {
    GatePtr gate = m_gate;
    std::string id = download.id;

    UnpackProgressFn reportProgress = [this, gate, id](double progress) {
        postThrough(gate, [this, id, progress] { setUnpackProgress(id, progress); });
    };

    MaybeError result;
    try {
        result = m_pipeline->handleArtifact(artifact, download, reportProgress);
    } catch (const std::exception& e) {
        result = DownloadError::pipelineFailed(e.what());
    }

    postThrough(gate, [this, id, taskIdentifier, result] {
        finishHandoff(id, taskIdentifier, result);
    });
}

void DownloadManager::finishHandoff(const std::string& id, uint64_t taskIdentifier,
                                    const MaybeError& pipelineError) {
    DownloadSnapshot snapshot;
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = findLocked(id);
        // A record that was re-issued meanwhile belongs to the new transfer
        if (it != m_downloads.end() && (!(*it)->task() || (*it)->hasTask(taskIdentifier))) {
            snapshot = (*it)->snapshot();
            m_downloads.erase(it);
            removed = true;
        }
    }

    if (pipelineError) {
        LOG_ERROR("Processing download {} failed: {}", id, pipelineError->reason);
        if (m_feedback) {
            m_feedback->operationFailed(id, *pipelineError);
        }
        publish(kEventDownloadFailed, {
            {"download", removed ? snapshot.toJson() : nlohmann::json{{"id", id}}},
            {"error", toString(pipelineError->code)},
            {"reason", pipelineError->reason}
        });
    }

    if (removed) {
        LOG_DEBUG("Download {} handed off", id);
        publish(kEventDownloadRemoved, snapshot.toJson());
    }
}

} // namespace hauler::core::downloader
