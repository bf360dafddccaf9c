#pragma once

/**
 * ThreadPool.hpp
 *
 * Named worker pool running fire-and-forget jobs in FIFO order.
 * With a single worker it is a serial queue: jobs never overlap and run in
 * the order they were posted.
 */

#include "Logger.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace hauler::core {

class ThreadPool {
public:
    using Job = std::function<void()>;

    /**
     * @param workers Number of worker threads (at least one is started)
     * @param name Prefix for log messages
     */
    explicit ThreadPool(size_t workers, std::string name)
        : m_name(std::move(name)) {
        if (workers == 0) workers = 1;

        m_threads.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            m_threads.emplace_back([this] { run(); });
        }
        LOG_TRACE("{}: started {} worker(s)", m_name, workers);
    }

    /**
     * Runs what is still queued, then joins
     */
    ~ThreadPool() {
        close();
        for (auto& thread : m_threads) {
            if (thread.joinable()) thread.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Queue a job. Exceptions escaping it are logged.
     * @return false once the pool is closed
     */
    bool post(Job job) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                LOG_WARN("{}: closed, job dropped", m_name);
                return false;
            }
            m_jobs.push_back(std::move(job));
        }
        m_wake.notify_one();
        return true;
    }

    /**
     * Stop accepting jobs. Queued jobs still run.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_wake.notify_all();
    }

    bool isIdle() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_jobs.empty() && m_running == 0;
    }

    /**
     * Block until the queue is empty and no job is running. Calling this
     * from one of the pool's own workers would deadlock.
     */
    void waitAll() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idle.wait(lock, [this] { return m_jobs.empty() && m_running == 0; });
    }

    bool isWorkerThread() const {
        auto self = std::this_thread::get_id();
        for (const auto& thread : m_threads) {
            if (thread.get_id() == self) return true;
        }
        return false;
    }

    const std::string& name() const { return m_name; }

private:
    void run() {
        for (;;) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_wake.wait(lock, [this] { return m_closed || !m_jobs.empty(); });
                if (m_jobs.empty()) return; // closed and drained

                job = std::move(m_jobs.front());
                m_jobs.pop_front();
                ++m_running;
            }

            try {
                job();
            } catch (const std::exception& e) {
                LOG_ERROR("{}: job failed: {}", m_name, e.what());
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            if (--m_running == 0 && m_jobs.empty()) {
                m_idle.notify_all();
            }
        }
    }

    const std::string m_name;
    std::vector<std::thread> m_threads;

    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    std::condition_variable m_idle;
    std::deque<Job> m_jobs;
    size_t m_running{0};
    bool m_closed{false};
};

} // namespace hauler::core
