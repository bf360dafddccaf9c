#pragma once

/**
 * TransferEngine.hpp
 *
 * Interface of the background-capable transfer engine the download
 * manager drives. An engine keeps its transfers alive independently of
 * the manager and can be re-attached to later.
 */

#include "TransferTask.hpp"

#include <functional>
#include <string>
#include <vector>

namespace hauler::core::downloader {

using TaskListCallback = std::function<void(std::vector<TransferTaskPtr>)>;

class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    /**
     * Create a suspended task for url
     */
    virtual TransferTaskPtr createTask(const std::string& url) = 0;

    /**
     * Create a suspended task continuing from resume data
     * @return nullptr if the data cannot be used
     */
    virtual TransferTaskPtr createTask(const ResumeData& resumeData) = 0;

    /**
     * Release resume data that will never be turned into a task, together
     * with whatever the engine keeps on disk for it
     */
    virtual void discardResumeData(const ResumeData& resumeData) = 0;

    /**
     * Deliver every task the engine still tracks. The callback may run on
     * an engine thread.
     */
    virtual void getAllTasks(TaskListCallback callback) = 0;

    /**
     * Attach the single event consumer. Events raised while no sink is
     * attached are queued and flushed on attach, followed by
     * EventsDelivered. Passing nullptr detaches.
     */
    virtual void setEventSink(TransferEventSink sink) = 0;

    /**
     * Whether transfers survive the controlling process going dormant
     */
    virtual bool supportsBackgroundTransfers() const = 0;
};

} // namespace hauler::core::downloader
