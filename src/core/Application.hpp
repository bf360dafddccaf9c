#pragma once

/**
 * Application.hpp
 *
 * Core application class that manages the lifecycle of the downloader.
 * Wires the transfer engine, the download manager and the archive pipeline
 * together.
 */

#include "EventBus.hpp"
#include "downloader/DownloadSettings.hpp"

#include <atomic>
#include <memory>
#include <string>

// Forward declarations in correct namespaces
namespace hauler::core::downloader {
class DownloadManager;
class TransferEngine;
class FailureFeedback;
}
namespace hauler::core::archive { class ArchiveExtractor; }

namespace hauler::core {

/**
 * Application state enum
 */
enum class AppState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Error
};

/**
 * Main application class
 *
 * Owns the event bus and every subsystem. Handles initialization, shutdown,
 * and the order in which subsystems are attached and detached.
 */
class Application {
public:
    /**
     * Constructor
     * @param settings Download settings (see DownloadSettings::fromConfig)
     * @param extractArchives Unpack finished zip artifacts
     */
    explicit Application(downloader::DownloadSettings settings, bool extractArchives = true);

    /**
     * Destructor
     */
    ~Application();

    // Disable copy and move
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /**
     * Initialize all application subsystems and reconcile with the
     * transfer session left by a previous run.
     * @return true if initialization successful
     */
    bool initialize();

    /**
     * Shutdown the application gracefully. Running transfers are suspended
     * and picked up again by the next run.
     */
    void shutdown();

    EventBus& events() { return m_events; }

    /**
     * Get download manager instance
     * @return Shared pointer to DownloadManager (null before initialize())
     */
    std::shared_ptr<downloader::DownloadManager> getDownloadManager() const { return m_downloadManager; }

    std::shared_ptr<archive::ArchiveExtractor> getArchiveExtractor() const { return m_extractor; }

    /**
     * Number of downloads whose post-processing failed
     */
    size_t failureCount() const { return m_failures.load(); }

    static std::string getVersion() { return "1.0.0"; }
    static std::string getName() { return "Hauler"; }

private:
    void setState(AppState state);

    bool initializeEngine();
    bool initializeDownloader();

private:
    std::atomic<AppState> m_state{AppState::Uninitialized};

    downloader::DownloadSettings m_settings;
    bool m_extractArchives;
    std::atomic<size_t> m_failures{0};

    // Declared first so it outlives the subsystems publishing on it
    EventBus m_events;

    std::shared_ptr<downloader::TransferEngine> m_engine;
    std::shared_ptr<archive::ArchiveExtractor> m_extractor;
    std::shared_ptr<downloader::FailureFeedback> m_feedback;
    std::shared_ptr<downloader::DownloadManager> m_downloadManager;
};

} // namespace hauler::core
