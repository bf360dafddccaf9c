#pragma once

/**
 * TransferTask.hpp
 *
 * Handle for one transfer inside a TransferEngine, plus the events an
 * engine reports about its tasks.
 */

#include "DownloadError.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace hauler::core::downloader {

/**
 * Opaque continuation data. Only the engine that produced it can interpret
 * the payload.
 */
struct ResumeData {
    std::string payload;

    bool empty() const { return payload.empty(); }
};

enum class TransferState {
    Running,
    Suspended,
    Canceling,
    Completed
};

inline const char* toString(TransferState state) {
    switch (state) {
        case TransferState::Running:   return "running";
        case TransferState::Suspended: return "suspended";
        case TransferState::Canceling: return "canceling";
        case TransferState::Completed: return "completed";
    }
    return "unknown";
}

/**
 * Terminal outcome of a transfer. Exactly one is produced per task.
 */
struct TransferResult {
    bool success{false};
    std::filesystem::path location;
    std::string suggestedFilename;
    std::optional<DownloadError> error;
    std::optional<ResumeData> resumeData;
};

/**
 * TransferTask - one network operation owned by an engine
 *
 * A new task starts out suspended; resume() starts it. The identifier is
 * stable for the lifetime of the engine session, including across process
 * restarts of an engine that persists its session.
 */
class TransferTask {
public:
    TransferTask()
        : m_result(m_promise.get_future().share()) {}

    virtual ~TransferTask() = default;

    TransferTask(const TransferTask&) = delete;
    TransferTask& operator=(const TransferTask&) = delete;

    virtual uint64_t identifier() const = 0;
    virtual std::string originalUrl() const = 0;
    virtual TransferState state() const = 0;
    virtual int64_t bytesReceived() const = 0;

    // 0 while unknown
    virtual int64_t bytesExpected() const = 0;

    // Name proposed by the server, empty if none
    virtual std::string suggestedFilename() const = 0;

    virtual void resume() = 0;
    virtual void suspend() = 0;
    virtual void cancel() = 0;

    /**
     * Cancel the task and hand back data that lets a new task continue from
     * the bytes already received. The completion receives std::nullopt when
     * the transfer cannot be continued.
     */
    virtual void cancelByProducingResumeData(
        std::function<void(std::optional<ResumeData>)> completion) = 0;

    double fractionCompleted() const {
        if (state() == TransferState::Completed) return 1.0;
        int64_t expected = bytesExpected();
        if (expected <= 0) return 0.0;
        double fraction = static_cast<double>(bytesReceived()) / static_cast<double>(expected);
        return std::clamp(fraction, 0.0, 1.0);
    }

    /**
     * Future for the terminal result of this task. It carries the same
     * outcome as the Finished or Failed event. The DownloadManager only
     * consumes events; this is for code that drives a task on its own and
     * wants to block until it ends.
     */
    std::shared_future<TransferResult> result() const { return m_result; }

protected:
    /**
     * Publish the terminal result. Later calls are ignored.
     * @return true if this call set the result
     */
    bool complete(TransferResult result) {
        bool first = false;
        std::call_once(m_completeOnce, [&] {
            m_promise.set_value(std::move(result));
            first = true;
        });
        return first;
    }

private:
    std::promise<TransferResult> m_promise;
    std::shared_future<TransferResult> m_result;
    std::once_flag m_completeOnce;
};

using TransferTaskPtr = std::shared_ptr<TransferTask>;

enum class TransferEventType {
    Progress,
    Finished,
    Failed,
    // Every event queued while no sink was attached has been delivered
    EventsDelivered
};

/**
 * Event reported by an engine about one of its tasks
 */
struct TransferEvent {
    TransferEventType type{TransferEventType::Progress};
    TransferTaskPtr task;

    // Progress
    int64_t bytesWritten{0};
    int64_t totalBytesWritten{0};
    int64_t totalBytesExpected{0};
    // The part file was truncated; totals start over from zero
    bool restarted{false};

    // Finished
    std::filesystem::path location;
    std::string suggestedFilename;
    // Finished in an earlier process, replayed from the engine's session
    bool recovered{false};

    // Failed
    std::optional<DownloadError> error;
    std::optional<ResumeData> resumeData;

    static TransferEvent progress(TransferTaskPtr task, int64_t bytesWritten,
                                  int64_t totalBytesWritten, int64_t totalBytesExpected,
                                  bool restarted = false) {
        TransferEvent event;
        event.type = TransferEventType::Progress;
        event.task = std::move(task);
        event.bytesWritten = bytesWritten;
        event.totalBytesWritten = totalBytesWritten;
        event.totalBytesExpected = totalBytesExpected;
        event.restarted = restarted;
        return event;
    }

    static TransferEvent finished(TransferTaskPtr task, std::filesystem::path location,
                                  std::string suggestedFilename, bool recovered = false) {
        TransferEvent event;
        event.type = TransferEventType::Finished;
        event.task = std::move(task);
        event.location = std::move(location);
        event.suggestedFilename = std::move(suggestedFilename);
        event.recovered = recovered;
        return event;
    }

    static TransferEvent failed(TransferTaskPtr task, DownloadError error,
                                std::optional<ResumeData> resumeData = std::nullopt) {
        TransferEvent event;
        event.type = TransferEventType::Failed;
        event.task = std::move(task);
        event.error = std::move(error);
        event.resumeData = std::move(resumeData);
        return event;
    }

    static TransferEvent eventsDelivered() {
        TransferEvent event;
        event.type = TransferEventType::EventsDelivered;
        return event;
    }
};

using TransferEventSink = std::function<void(TransferEvent)>;

} // namespace hauler::core::downloader
