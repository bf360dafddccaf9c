#pragma once

// In-memory TransferEngine for driving the DownloadManager from tests.
// Nothing happens on its own: tests push progress, completion and failure
// events explicitly. Events are delivered synchronously on the calling
// thread, like an engine thread would.

#include "core/downloader/TransferEngine.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hauler::test {

using namespace hauler::core::downloader;

class FakeTransferEngine;

class FakeTransferTask : public TransferTask, public std::enable_shared_from_this<FakeTransferTask> {
public:
    FakeTransferTask(FakeTransferEngine& engine, uint64_t identifier, std::string url,
                     bool fromResumeData = false)
        : m_engine(engine)
        , m_identifier(identifier)
        , m_url(std::move(url))
        , m_fromResumeData(fromResumeData) {}

    uint64_t identifier() const override { return m_identifier; }
    std::string originalUrl() const override { return m_url; }

    TransferState state() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state;
    }

    int64_t bytesReceived() const override { return m_received.load(); }
    int64_t bytesExpected() const override { return m_expected.load(); }

    std::string suggestedFilename() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_suggestedFilename;
    }

    void resume() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_resumeCalls;
        if (m_state == TransferState::Suspended) m_state = TransferState::Running;
    }

    void suspend() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_suspendCalls;
        if (m_state == TransferState::Running) m_state = TransferState::Suspended;
    }

    void cancel() override;
    void cancelByProducingResumeData(std::function<void(std::optional<ResumeData>)> completion) override;

    // -- test helpers --

    void setState(TransferState state) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = state;
    }

    void setCounters(int64_t received, int64_t expected) {
        m_received = received;
        m_expected = expected;
    }

    void setSuggestedFilename(std::string name) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_suggestedFilename = std::move(name);
    }

    int resumeCalls() const { std::lock_guard<std::mutex> lock(m_mutex); return m_resumeCalls; }
    int suspendCalls() const { std::lock_guard<std::mutex> lock(m_mutex); return m_suspendCalls; }
    bool wasCancelled() const { return m_cancelled.load(); }
    bool fromResumeData() const { return m_fromResumeData; }

    bool finish(TransferResult result) { return complete(std::move(result)); }

    /**
     * Hand back the resume data of a pause held back by
     * FakeTransferEngine::deferPauses
     * @return false if no pause is pending
     */
    bool completePause();

private:
    FakeTransferEngine& m_engine;
    const uint64_t m_identifier;
    const std::string m_url;
    const bool m_fromResumeData;

    mutable std::mutex m_mutex;
    TransferState m_state{TransferState::Suspended};
    std::string m_suggestedFilename;
    int m_resumeCalls{0};
    int m_suspendCalls{0};
    std::function<void(std::optional<ResumeData>)> m_pauseCompletion;

    std::atomic<int64_t> m_received{0};
    std::atomic<int64_t> m_expected{0};
    std::atomic<bool> m_cancelled{false};
};

using FakeTaskPtr = std::shared_ptr<FakeTransferTask>;

class FakeTransferEngine : public TransferEngine {
public:
    TransferTaskPtr createTask(const std::string& url) override {
        if (refuseNewTasks) return nullptr;
        return track(std::make_shared<FakeTransferTask>(*this, m_nextIdentifier++, url));
    }

    TransferTaskPtr createTask(const ResumeData& resumeData) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_consumedResumeData.push_back(resumeData.payload);
        }
        if (!acceptResumeData) return nullptr;

        // Payload produced by cancelByProducingResumeData: "<url>|<bytes>"
        auto bar = resumeData.payload.rfind('|');
        std::string url = resumeData.payload.substr(0, bar);
        auto task = std::make_shared<FakeTransferTask>(*this, m_nextIdentifier++, url, true);
        if (bar != std::string::npos) {
            task->setCounters(std::stoll(resumeData.payload.substr(bar + 1)), 0);
        }
        return track(task);
    }

    void discardResumeData(const ResumeData& resumeData) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_discardedResumeData.push_back(resumeData.payload);
    }

    void getAllTasks(TaskListCallback callback) override {
        std::vector<TransferTaskPtr> live;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto& task : m_tasks) {
                if (task->state() != TransferState::Completed) live.push_back(task);
            }
        }
        callback(std::move(live));
    }

    void setEventSink(TransferEventSink sink) override {
        std::lock_guard<std::mutex> lock(m_sinkMutex);
        m_sink = std::move(sink);
        if (!m_sink) return;

        auto pending = std::move(m_pending);
        m_pending.clear();
        for (auto& event : pending) m_sink(std::move(event));
        m_sink(TransferEvent::eventsDelivered());
    }

    bool supportsBackgroundTransfers() const override { return true; }

    // -- test drivers --

    void emit(TransferEvent event) {
        std::lock_guard<std::mutex> lock(m_sinkMutex);
        if (m_sink) {
            m_sink(std::move(event));
        } else {
            m_pending.push_back(std::move(event));
        }
    }

    void progress(const FakeTaskPtr& task, int64_t written, int64_t totalWritten, int64_t expected,
                  bool restarted = false) {
        task->setCounters(totalWritten, expected);
        emit(TransferEvent::progress(task, written, totalWritten, expected, restarted));
    }

    void finish(const FakeTaskPtr& task, const std::filesystem::path& location,
                const std::string& suggestedFilename = "", bool recovered = false) {
        task->setState(TransferState::Completed);
        task->setSuggestedFilename(suggestedFilename);

        TransferResult result;
        result.success = true;
        result.location = location;
        result.suggestedFilename = suggestedFilename;
        task->finish(result);

        emit(TransferEvent::finished(task, location, suggestedFilename, recovered));
    }

    void fail(const FakeTaskPtr& task, const std::string& reason) {
        task->setState(TransferState::Completed);
        auto error = DownloadError::transferFailed(reason);

        TransferResult result;
        result.error = error;
        task->finish(result);

        emit(TransferEvent::failed(task, error));
    }

    void deliverEvents() { emit(TransferEvent::eventsDelivered()); }

    /**
     * Task the engine tracks without the manager having asked for it
     * (left over from a previous process)
     */
    FakeTaskPtr addOrphan(const std::string& url, TransferState state,
                          int64_t received = 0, int64_t expected = 0) {
        auto task = std::make_shared<FakeTransferTask>(*this, m_nextIdentifier++, url);
        task->setState(state);
        task->setCounters(received, expected);
        track(task);
        return task;
    }

    FakeTaskPtr task(size_t index) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return index < m_tasks.size() ? m_tasks[index] : nullptr;
    }

    FakeTaskPtr lastTask() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tasks.empty() ? nullptr : m_tasks.back();
    }

    size_t taskCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tasks.size();
    }

    std::vector<std::string> consumedResumeData() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_consumedResumeData;
    }

    std::vector<std::string> discardedResumeData() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_discardedResumeData;
    }

    bool refuseNewTasks{false};
    bool acceptResumeData{true};
    // Pauses stay Canceling until FakeTransferTask::completePause()
    std::atomic<bool> deferPauses{false};

private:
    FakeTaskPtr track(FakeTaskPtr task) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.push_back(task);
        return task;
    }

    mutable std::mutex m_mutex;
    std::vector<FakeTaskPtr> m_tasks;
    std::vector<std::string> m_consumedResumeData;
    std::vector<std::string> m_discardedResumeData;
    std::atomic<uint64_t> m_nextIdentifier{100};

    std::mutex m_sinkMutex;
    TransferEventSink m_sink;
    std::vector<TransferEvent> m_pending;
};

inline void FakeTransferTask::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // A pending pause finishes on its own, like a real engine's would
        if (m_state == TransferState::Completed || m_state == TransferState::Canceling) return;
        m_state = TransferState::Completed;
    }
    m_cancelled = true;

    TransferResult result;
    result.error = DownloadError::cancelled();
    complete(result);

    m_engine.emit(TransferEvent::failed(shared_from_this(), DownloadError::cancelled()));
}

inline void FakeTransferTask::cancelByProducingResumeData(
    std::function<void(std::optional<ResumeData>)> completion) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == TransferState::Completed || m_state == TransferState::Canceling) {
            if (completion) completion(std::nullopt);
            return;
        }
        m_state = TransferState::Canceling;
        m_pauseCompletion = std::move(completion);
    }

    if (!m_engine.deferPauses) {
        completePause();
    }
}

inline bool FakeTransferTask::completePause() {
    std::function<void(std::optional<ResumeData>)> completion;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != TransferState::Canceling) return false;
        m_state = TransferState::Completed;
        completion = std::move(m_pauseCompletion);
    }
    m_cancelled = true;

    ResumeData data{m_url + "|" + std::to_string(m_received.load())};

    TransferResult result;
    result.error = DownloadError::cancelled();
    result.resumeData = data;
    complete(result);

    m_engine.emit(TransferEvent::failed(shared_from_this(), DownloadError::cancelled(), data));
    if (completion) completion(data);
    return true;
}

} // namespace hauler::test
