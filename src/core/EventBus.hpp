#pragma once

/**
 * EventBus.hpp
 *
 * Publish/subscribe channel for download lifecycle notifications.
 * Payloads are JSON; subscribers pick events by exact name, by a
 * "prefix.*" pattern or with "*" for everything.
 */

#include "Logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hauler::core {

using json = nlohmann::json;

/**
 * Receives the event name as well, so one callback can serve a pattern
 */
using EventCallback = std::function<void(const std::string& event, const json& data)>;

/**
 * EventBus
 *
 * Thread-safe. Callbacks run on the emitting thread, outside the bus lock,
 * so a callback may subscribe or unsubscribe. A callback that throws is
 * logged and does not stop delivery to the others.
 */
class EventBus {
public:
    using Handle = uint64_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @param pattern Event name, "prefix.*" or "*"
     * @return Handle for unsubscribe()
     */
    Handle subscribe(const std::string& pattern, EventCallback callback) {
        return add(pattern, std::move(callback), false);
    }

    /**
     * Like subscribe(), but the callback is dropped after its first delivery
     */
    Handle once(const std::string& pattern, EventCallback callback) {
        return add(pattern, std::move(callback), true);
    }

    /**
     * @return false if the handle is unknown or already gone
     */
    bool unsubscribe(Handle handle) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_subscribers.begin(), m_subscribers.end(),
                               [handle](const Subscriber& s) { return s.handle == handle; });
        if (it == m_subscribers.end()) return false;

        // An emit that already copied it must not deliver any more
        it->live->store(false);
        m_subscribers.erase(it);
        return true;
    }

    /**
     * Deliver data to every subscriber whose pattern matches event
     * @return Number of callbacks that were run
     */
    size_t emit(const std::string& event, const json& data = json::object()) {
        std::vector<Subscriber> targets;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (const auto& subscriber : m_subscribers) {
                if (matches(subscriber.pattern, event)) {
                    targets.push_back(subscriber);
                }
            }
        }

        size_t delivered = 0;
        for (const auto& subscriber : targets) {
            if (subscriber.once) {
                // Whoever flips the flag first owns the single delivery
                if (!subscriber.live->exchange(false)) continue;
                unsubscribe(subscriber.handle);
            } else if (!subscriber.live->load()) {
                continue;
            }

            try {
                subscriber.callback(event, data);
                ++delivered;
            } catch (const std::exception& e) {
                LOG_ERROR("Subscriber of '{}' threw: {}", event, e.what());
            }
        }
        return delivered;
    }

    /**
     * Number of subscribers an emit of event would reach
     */
    size_t subscriberCount(const std::string& event) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<size_t>(std::count_if(m_subscribers.begin(), m_subscribers.end(),
            [&event](const Subscriber& s) { return matches(s.pattern, event); }));
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& subscriber : m_subscribers) {
            subscriber.live->store(false);
        }
        m_subscribers.clear();
    }

    static bool matches(const std::string& pattern, const std::string& event) {
        if (pattern == "*") return true;
        if (pattern.size() >= 2 && pattern.compare(pattern.size() - 2, 2, ".*") == 0) {
            // "download.*" matches "download.added" but not "downloads.reconciled"
            return event.size() > pattern.size() - 1
                && event.compare(0, pattern.size() - 1, pattern, 0, pattern.size() - 1) == 0;
        }
        return pattern == event;
    }

private:
    struct Subscriber {
        Handle handle;
        std::string pattern;
        EventCallback callback;
        bool once;
        std::shared_ptr<std::atomic<bool>> live;
    };

    Handle add(const std::string& pattern, EventCallback callback, bool once) {
        std::lock_guard<std::mutex> lock(m_mutex);
        Handle handle = ++m_lastHandle;
        m_subscribers.push_back({handle, pattern, std::move(callback), once,
                                 std::make_shared<std::atomic<bool>>(true)});
        return handle;
    }

    mutable std::mutex m_mutex;
    std::vector<Subscriber> m_subscribers;
    Handle m_lastHandle{0};
};

} // namespace hauler::core
