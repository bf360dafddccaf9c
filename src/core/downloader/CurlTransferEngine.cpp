/**
 * CurlTransferEngine.cpp
 *
 * Resumable transfers on top of cpr. Resume uses HTTP range requests
 * guarded by If-Range; servers that answer with a full body restart the
 * part file from zero.
 */

#include "CurlTransferEngine.hpp"
#include "ResponseHead.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"
#include "../../utils/UrlUtils.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <string_view>

namespace hauler::core::downloader {

using json = nlohmann::json;
using utils::FileUtils;
using utils::StringUtils;

namespace {

constexpr auto kProgressInterval = std::chrono::milliseconds(250);
constexpr int kResumeDataVersion = 1;

bool isHttpUrl(const std::string& url) {
    auto parts = utils::UrlUtils::parse(url);
    return parts && (parts->scheme == "http" || parts->scheme == "https");
}

} // namespace

// ============================================================================
// CurlTransferTask
// ============================================================================

CurlTransferTask::CurlTransferTask(std::weak_ptr<CurlTransferEngine> engine,
                                   uint64_t identifier,
                                   std::string url,
                                   std::filesystem::path partFile)
    : m_engine(std::move(engine))
    , m_identifier(identifier)
    , m_url(std::move(url))
    , m_partFile(std::move(partFile)) {
}

TransferState CurlTransferTask::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::string CurlTransferTask::suggestedFilename() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_suggestedFilename;
}

bool CurlTransferTask::shouldContinue() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state == TransferState::Running;
}

JournalEntry CurlTransferTask::journalEntry() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    JournalEntry entry;
    entry.identifier = m_identifier;
    entry.url = m_url;
    entry.running = m_state == TransferState::Running;
    entry.bytesExpected = m_bytesExpected.load();
    entry.etag = m_etag;
    entry.lastModified = m_lastModified;
    entry.suggestedFilename = m_suggestedFilename;
    return entry;
}

void CurlTransferTask::resume() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != TransferState::Suspended) return;
        m_state = TransferState::Running;

        // A worker that is still unwinding from suspend() picks this up
        if (m_active) return;
        m_active = true;
    }

    auto engine = m_engine.lock();
    if (!engine) {
        LOG_WARN("Transfer engine is gone, task {} cannot resume", m_identifier);
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = TransferState::Suspended;
        m_active = false;
        return;
    }
    engine->schedule(shared_from_this());
}

void CurlTransferTask::suspend() {
    bool idle = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != TransferState::Running) return;
        m_state = TransferState::Suspended;
        idle = !m_active;
    }

    // Otherwise the worker records the suspension once the request unwinds
    if (idle) {
        if (auto engine = m_engine.lock()) {
            engine->persist(*this);
        }
    }
}

void CurlTransferTask::cancel() {
    requestCancel(false, nullptr);
}

void CurlTransferTask::cancelByProducingResumeData(
    std::function<void(std::optional<ResumeData>)> completion) {
    requestCancel(true, std::move(completion));
}

void CurlTransferTask::requestCancel(bool produceResumeData,
                                     std::function<void(std::optional<ResumeData>)> completion) {
    bool alreadyFinishing = false;
    bool finishNow = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == TransferState::Completed || m_state == TransferState::Canceling) {
            alreadyFinishing = true;
        } else {
            m_state = TransferState::Canceling;
            m_produceResumeData = produceResumeData;
            m_resumeCompletion = std::move(completion);
            finishNow = !m_active;
        }
    }

    if (alreadyFinishing) {
        if (completion) completion(std::nullopt);
        return;
    }
    if (!finishNow) return;

    if (auto engine = m_engine.lock()) {
        engine->finishCancel(shared_from_this());
        return;
    }

    // Engine gone: nothing can be resumed any more
    std::function<void(std::optional<ResumeData>)> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = TransferState::Completed;
        pending = std::move(m_resumeCompletion);
    }
    TransferResult result;
    result.error = DownloadError::cancelled();
    complete(std::move(result));
    if (pending) pending(std::nullopt);
}

// ============================================================================
// CurlTransferEngine
// ============================================================================

std::shared_ptr<CurlTransferEngine> CurlTransferEngine::create(DownloadSettings settings) {
    std::shared_ptr<CurlTransferEngine> engine(new CurlTransferEngine(std::move(settings)));
    engine->restoreSession();
    return engine;
}

CurlTransferEngine::CurlTransferEngine(DownloadSettings settings)
    : m_settings(std::move(settings))
    , m_journal(m_settings.sessionDirectory, m_settings.sessionIdentifier) {

    utils::CurlGlobalInit::init();

    std::error_code ec;
    if (!FileUtils::createDirectories(m_settings.sessionDirectory, ec)) {
        Logger::instance().error("Cannot create session directory {}: {}",
                                 m_settings.sessionDirectory.string(), ec.message());
    }

    m_pool = std::make_unique<ThreadPool>(m_settings.maxConcurrent, "transfer");
}

CurlTransferEngine::~CurlTransferEngine() {
    m_closing = true;

    std::vector<std::shared_ptr<CurlTransferTask>> running;
    {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        for (const auto& [identifier, task] : m_tasks) {
            if (task->state() == TransferState::Running) {
                running.push_back(task);
            }
        }
    }

    for (const auto& task : running) {
        task->suspend();
    }

    // Workers notice the suspension on their next callback
    m_pool.reset();

    // Restart these on the next launch. A worker may have finished or
    // cancelled one of them before it saw the suspension.
    for (const auto& task : running) {
        if (task->state() != TransferState::Suspended) continue;

        auto entry = task->journalEntry();
        entry.running = true;
        m_journal.put(entry);
    }

    Logger::instance().info("Transfer session {} closed ({} transfer(s) interrupted)",
                            m_settings.sessionIdentifier, running.size());
}

void CurlTransferEngine::restoreSession() {
    size_t count = m_journal.load();
    if (count == 0) return;

    std::vector<std::shared_ptr<CurlTransferTask>> toResume;

    for (const auto& entry : m_journal.entries()) {
        if (entry.finished) {
            restoreFinished(entry);
            continue;
        }

        auto task = makeTask(entry.identifier, entry.url);
        task->m_bytesReceived = FileUtils::getFileSize(task->partFile());
        task->m_bytesExpected = entry.bytesExpected;
        {
            std::lock_guard<std::mutex> lock(task->m_mutex);
            task->m_etag = entry.etag;
            task->m_lastModified = entry.lastModified;
            task->m_suggestedFilename = entry.suggestedFilename;
        }

        if (entry.running) {
            toResume.push_back(task);
        }
    }

    Logger::instance().info("Restored {} transfer(s) from session {}",
                            count, m_settings.sessionIdentifier);

    for (const auto& task : toResume) {
        task->resume();
    }
}

void CurlTransferEngine::restoreFinished(const JournalEntry& entry) {
    auto task = std::make_shared<CurlTransferTask>(weak_from_this(), entry.identifier, entry.url,
                                                   partFileFor(entry.identifier));

    if (!FileUtils::fileExists(task->partFile())) {
        LOG_WARN("Finished transfer {} lost its file, dropping it", entry.identifier);
        m_journal.remove(entry.identifier);
        return;
    }

    int64_t size = FileUtils::getFileSize(task->partFile());
    task->m_bytesReceived = size;
    task->m_bytesExpected = entry.bytesExpected > 0 ? entry.bytesExpected : size;
    {
        std::lock_guard<std::mutex> lock(task->m_mutex);
        task->m_state = TransferState::Completed;
        task->m_etag = entry.etag;
        task->m_lastModified = entry.lastModified;
        task->m_suggestedFilename = entry.suggestedFilename;
    }

    TransferResult result;
    result.success = true;
    result.location = task->partFile();
    result.suggestedFilename = entry.suggestedFilename;
    task->complete(result);

    // No sink can be attached yet; the event waits for the first one
    std::lock_guard<std::mutex> lock(m_sinkMutex);
    m_pendingEvents.push_back(TransferEvent::finished(task, task->partFile(),
                                                      entry.suggestedFilename, true));
    LOG_INFO("Transfer {} finished in an earlier session, re-delivering it", entry.identifier);
}

std::shared_ptr<CurlTransferTask> CurlTransferEngine::makeTask(uint64_t identifier, const std::string& url) {
    auto task = std::make_shared<CurlTransferTask>(weak_from_this(), identifier, url, partFileFor(identifier));

    std::lock_guard<std::mutex> lock(m_tasksMutex);
    m_tasks[identifier] = task;
    return task;
}

std::filesystem::path CurlTransferEngine::partFileFor(uint64_t identifier) const {
    return m_settings.sessionDirectory / (std::to_string(identifier) + ".part");
}

TransferTaskPtr CurlTransferEngine::createTask(const std::string& url) {
    if (!utils::UrlUtils::isTransferUrl(url)) {
        LOG_WARN("Refusing to transfer '{}': unsupported url", url);
        return nullptr;
    }

    auto task = makeTask(m_journal.nextIdentifier(), url);

    // Leftover from an earlier session that reused nothing
    std::error_code ec;
    FileUtils::removeFileIfExists(task->partFile(), ec);

    persist(*task);
    LOG_DEBUG("Created transfer task {} for {}", task->identifier(), url);
    return task;
}

TransferTaskPtr CurlTransferEngine::createTask(const ResumeData& resumeData) {
    if (resumeData.empty()) return nullptr;

    try {
        auto j = json::parse(resumeData.payload);
        if (j.value("version", 0) != kResumeDataVersion) {
            LOG_WARN("Resume data has an unknown version");
            return nullptr;
        }

        std::string url = j.at("url").get<std::string>();
        std::filesystem::path partFile = j.at("partFile").get<std::string>();

        if (!utils::UrlUtils::isTransferUrl(url)) return nullptr;
        if (!FileUtils::fileExists(partFile)) {
            LOG_WARN("Resume data refers to missing file {}", partFile.string());
            return nullptr;
        }

        auto task = makeTask(m_journal.nextIdentifier(), url);

        std::error_code ec;
        if (partFile != task->partFile() && !FileUtils::moveFile(partFile, task->partFile(), ec)) {
            LOG_WARN("Cannot adopt partial file {}: {}", partFile.string(), ec.message());
            forget(task->identifier());
            return nullptr;
        }

        task->m_bytesReceived = FileUtils::getFileSize(task->partFile());
        task->m_bytesExpected = j.value("bytesExpected", int64_t(0));
        {
            std::lock_guard<std::mutex> lock(task->m_mutex);
            task->m_etag = j.value("etag", "");
            task->m_lastModified = j.value("lastModified", "");
            task->m_suggestedFilename = j.value("suggestedFilename", "");
        }

        persist(*task);
        LOG_DEBUG("Created transfer task {} from resume data at {} bytes",
                  task->identifier(), task->bytesReceived());
        return task;

    } catch (const json::exception& e) {
        LOG_WARN("Invalid resume data: {}", e.what());
        return nullptr;
    }
}

void CurlTransferEngine::discardResumeData(const ResumeData& resumeData) {
    if (resumeData.empty()) return;

    std::filesystem::path partFile;
    try {
        auto j = json::parse(resumeData.payload);
        partFile = j.at("partFile").get<std::string>();
    } catch (const json::exception& e) {
        LOG_WARN("Invalid resume data: {}", e.what());
        return;
    }

    // Only part files this engine wrote are ours to delete
    if (partFile.extension() != ".part"
        || partFile.lexically_normal().parent_path() != m_settings.sessionDirectory.lexically_normal()) {
        LOG_WARN("Not discarding {}: outside the session directory", partFile.string());
        return;
    }

    std::error_code ec;
    if (!FileUtils::removeFileIfExists(partFile, ec)) {
        LOG_WARN("Cannot remove {}: {}", partFile.string(), ec.message());
        return;
    }
    LOG_DEBUG("Discarded resume data for {}", partFile.string());
}

void CurlTransferEngine::getAllTasks(TaskListCallback callback) {
    std::vector<TransferTaskPtr> tasks;
    {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        tasks.reserve(m_tasks.size());
        for (const auto& [identifier, task] : m_tasks) {
            if (task->state() != TransferState::Completed) {
                tasks.push_back(task);
            }
        }
    }

    if (callback) {
        callback(std::move(tasks));
    }
}

void CurlTransferEngine::setEventSink(TransferEventSink sink) {
    std::lock_guard<std::mutex> lock(m_sinkMutex);

    m_sink = std::move(sink);
    if (!m_sink) return;

    std::vector<TransferEvent> pending;
    pending.swap(m_pendingEvents);
    for (auto& event : pending) {
        deliverLocked(std::move(event));
    }
    m_sink(TransferEvent::eventsDelivered());
}

void CurlTransferEngine::emit(TransferEvent event) {
    std::lock_guard<std::mutex> lock(m_sinkMutex);

    if (m_sink) {
        deliverLocked(std::move(event));
    } else if (event.type != TransferEventType::Progress) {
        m_pendingEvents.push_back(std::move(event));
    }
}

void CurlTransferEngine::deliverLocked(TransferEvent event) {
    uint64_t finished = 0;
    bool delivered = event.type == TransferEventType::Finished && event.task;
    if (delivered) {
        finished = event.task->identifier();
    }

    m_sink(std::move(event));

    // The artifact is the sink's now; a restart no longer needs to know it
    if (delivered) {
        m_journal.remove(finished);
    }
}

void CurlTransferEngine::persist(const CurlTransferTask& task) {
    if (task.state() == TransferState::Completed) return;
    m_journal.put(task.journalEntry());
}

void CurlTransferEngine::forget(uint64_t identifier) {
    m_journal.remove(identifier);

    std::lock_guard<std::mutex> lock(m_tasksMutex);
    m_tasks.erase(identifier);
}

void CurlTransferEngine::schedule(const std::shared_ptr<CurlTransferTask>& task) {
    persist(*task);

    if (m_closing || !m_pool->post([this, task] { runTransfer(task); })) {
        std::lock_guard<std::mutex> lock(task->m_mutex);
        task->m_state = TransferState::Suspended;
        task->m_active = false;
    }
}

void CurlTransferEngine::runTransfer(const std::shared_ptr<CurlTransferTask>& task) {
    while (true) {
        Attempt attempt;
        if (task->shouldContinue()) {
            attempt = performRequest(task);
        } else {
            attempt.aborted = true;
        }

        TransferState state;
        {
            std::lock_guard<std::mutex> lock(task->m_mutex);
            state = task->m_state;

            if (state == TransferState::Suspended) {
                task->m_active = false;
            }
        }

        switch (state) {
            case TransferState::Running:
                if (attempt.aborted) {
                    // Suspended and resumed again while the request unwound
                    continue;
                }
                if (attempt.error.empty()) {
                    attempt.error = ResponseHead::failureReason(attempt.statusCode);
                }
                if (!attempt.error.empty()) {
                    finishFailure(task, attempt.error);
                } else {
                    finishSuccess(task);
                }
                return;

            case TransferState::Suspended:
                persist(*task);
                LOG_DEBUG("Transfer {} suspended at {} bytes", task->identifier(), task->bytesReceived());
                return;

            case TransferState::Canceling:
                finishCancel(task);
                return;

            case TransferState::Completed:
                return;
        }
    }
}

CurlTransferEngine::Attempt CurlTransferEngine::performRequest(const std::shared_ptr<CurlTransferTask>& task) {
    Attempt attempt;

    const bool http = isHttpUrl(task->originalUrl());
    const std::filesystem::path& partPath = task->partFile();

    // Only HTTP supports continuing a part file
    int64_t offset = http ? FileUtils::getFileSize(partPath) : 0;

    std::ofstream file(partPath, std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc));
    if (!file.is_open()) {
        attempt.error = "cannot open " + partPath.string();
        return attempt;
    }
    task->m_bytesReceived = offset;

    cpr::Header headers;
    if (offset > 0) {
        headers["Range"] = "bytes=" + std::to_string(offset) + "-";

        std::lock_guard<std::mutex> lock(task->m_mutex);
        std::string validator = ResponseHead::ifRangeValidator(task->m_etag, task->m_lastModified);
        if (!validator.empty()) {
            headers["If-Range"] = validator;
        }
    }

    ResponseHead head;
    bool accepting = !http;
    bool writeFailed = false;
    int64_t unreported = 0;
    auto lastReport = std::chrono::steady_clock::now();

    auto beginBody = [&]() {
        bool restarted = head.restartsFrom(offset);
        if (restarted) {
            // Range ignored or validator changed: the body is the whole file
            LOG_INFO("Server sent a full body for transfer {}, restarting from zero", task->identifier());
            file.close();
            file.open(partPath, std::ios::binary | std::ios::trunc);
            offset = 0;
            task->m_bytesReceived = 0;
        }

        task->m_bytesExpected = head.expectedSize(offset);

        {
            std::lock_guard<std::mutex> lock(task->m_mutex);
            if (!head.etag().empty()) task->m_etag = head.etag();
            if (!head.lastModified().empty()) task->m_lastModified = head.lastModified();
            if (auto name = utils::UrlUtils::fileNameFromContentDisposition(head.disposition())) {
                task->m_suggestedFilename = *name;
            }
        }
        persist(*task);

        if (restarted) {
            emit(TransferEvent::progress(task, 0, 0, task->bytesExpected(), true));
        }

        accepting = file.is_open();
        if (!accepting) {
            writeFailed = true;
        }
    };

    auto onHeader = [&](std::string_view line, intptr_t) -> bool {
        // Only the 2xx head that ends the redirect chain carries our body
        if (http && head.parseLine(std::string(line))) {
            beginBody();
        }
        return true;
    };

    auto onWrite = [&](std::string_view data, intptr_t) -> bool {
        if (!task->shouldContinue()) {
            attempt.aborted = true;
            return false;
        }
        if (!accepting) return !writeFailed;

        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!file) {
            writeFailed = true;
            return false;
        }

        int64_t chunk = static_cast<int64_t>(data.size());
        int64_t total = task->m_bytesReceived += chunk;
        unreported += chunk;

        auto now = std::chrono::steady_clock::now();
        if (now - lastReport >= kProgressInterval) {
            lastReport = now;
            emit(TransferEvent::progress(task, unreported, total, task->bytesExpected()));
            unreported = 0;
        }
        return true;
    };

    auto onProgress = [&](cpr::cpr_off_t downloadTotal, cpr::cpr_off_t downloadNow,
                          cpr::cpr_off_t uploadTotal, cpr::cpr_off_t uploadNow,
                          intptr_t userdata) -> bool {
        (void)downloadNow; (void)uploadTotal; (void)uploadNow; (void)userdata;

        if (!http && downloadTotal > 0) {
            task->m_bytesExpected = static_cast<int64_t>(downloadTotal);
        }
        if (!task->shouldContinue()) {
            attempt.aborted = true;
            return false; // Cancel download
        }
        return true;
    };

    cpr::Response response = cpr::Get(
        cpr::Url{task->originalUrl()},
        headers,
        cpr::UserAgent{m_settings.userAgent},
        cpr::Timeout{m_settings.requestTimeout()},
        cpr::ConnectTimeout{m_settings.connectTimeout()},
        cpr::HeaderCallback{onHeader},
        cpr::WriteCallback{onWrite},
        cpr::ProgressCallback{onProgress}
    );

    file.close();

    if (unreported > 0) {
        emit(TransferEvent::progress(task, unreported, task->bytesReceived(), task->bytesExpected()));
    }

    attempt.statusCode = response.status_code;
    if (writeFailed) {
        attempt.error = "cannot write " + partPath.string();
    } else if (!attempt.aborted && response.error) {
        attempt.error = response.error.message;
    }
    return attempt;
}

void CurlTransferEngine::finishSuccess(const std::shared_ptr<CurlTransferTask>& task) {
    std::string suggested;
    {
        std::lock_guard<std::mutex> lock(task->m_mutex);
        task->m_state = TransferState::Completed;
        task->m_active = false;
        suggested = task->m_suggestedFilename;
    }

    int64_t received = task->bytesReceived();
    if (task->bytesExpected() <= 0) {
        task->m_bytesExpected = received;
    }

    // Kept in the journal until a sink has taken the Finished event
    auto entry = task->journalEntry();
    entry.running = false;
    entry.finished = true;
    m_journal.put(entry);
    {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_tasks.erase(task->identifier());
    }

    Logger::instance().info("Transfer {} complete ({})", task->identifier(), StringUtils::formatBytes(received));

    emit(TransferEvent::finished(task, task->partFile(), suggested));

    TransferResult result;
    result.success = true;
    result.location = task->partFile();
    result.suggestedFilename = suggested;
    task->complete(std::move(result));
}

void CurlTransferEngine::finishFailure(const std::shared_ptr<CurlTransferTask>& task, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(task->m_mutex);
        task->m_state = TransferState::Completed;
        task->m_active = false;
    }

    std::error_code ec;
    FileUtils::removeFileIfExists(task->partFile(), ec);
    forget(task->identifier());

    Logger::instance().warn("Transfer {} failed: {}", task->identifier(), reason);

    auto error = DownloadError::transferFailed(reason);
    emit(TransferEvent::failed(task, error));

    TransferResult result;
    result.error = error;
    task->complete(std::move(result));
}

void CurlTransferEngine::finishCancel(const std::shared_ptr<CurlTransferTask>& task) {
    bool produce = false;
    std::function<void(std::optional<ResumeData>)> completion;
    std::string etag, lastModified, suggested;
    {
        std::lock_guard<std::mutex> lock(task->m_mutex);
        task->m_state = TransferState::Completed;
        task->m_active = false;
        produce = task->m_produceResumeData;
        completion = std::move(task->m_resumeCompletion);
        etag = task->m_etag;
        lastModified = task->m_lastModified;
        suggested = task->m_suggestedFilename;
    }

    std::optional<ResumeData> resumeData;
    if (produce && task->bytesReceived() > 0 && FileUtils::fileExists(task->partFile())) {
        // The part file now belongs to whoever holds the resume data
        json j = {
            {"version", kResumeDataVersion},
            {"url", task->originalUrl()},
            {"partFile", task->partFile().string()},
            {"bytesReceived", task->bytesReceived()},
            {"bytesExpected", task->bytesExpected()},
            {"etag", etag},
            {"lastModified", lastModified},
            {"suggestedFilename", suggested}
        };
        resumeData = ResumeData{j.dump()};
    } else {
        std::error_code ec;
        FileUtils::removeFileIfExists(task->partFile(), ec);
    }

    forget(task->identifier());

    LOG_DEBUG("Transfer {} cancelled{}", task->identifier(), resumeData ? " with resume data" : "");

    emit(TransferEvent::failed(task, DownloadError::cancelled(), resumeData));

    TransferResult result;
    result.error = DownloadError::cancelled();
    result.resumeData = resumeData;
    task->complete(std::move(result));

    if (completion) {
        completion(resumeData);
    }
}

} // namespace hauler::core::downloader
