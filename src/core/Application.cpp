/**
 * Application.cpp
 *
 * Implementation of the core Application class.
 */

#include "Application.hpp"
#include "Logger.hpp"
#include "archive/ArchiveExtractor.hpp"
#include "downloader/CurlTransferEngine.hpp"
#include "downloader/DownloadManager.hpp"
#include "../utils/UrlUtils.hpp"

#include <chrono>

namespace hauler::core {

namespace {

/**
 * Failure feedback for a console process: log it and count it
 */
class LoggingFailureFeedback : public downloader::FailureFeedback {
public:
    explicit LoggingFailureFeedback(std::atomic<size_t>& counter)
        : m_counter(counter) {}

    void operationFailed(const std::string& downloadId, const downloader::DownloadError& error) override {
        ++m_counter;
        Logger::instance().error("Download {} could not be processed ({}): {}",
                                 downloadId, downloader::toString(error.code), error.reason);
    }

private:
    std::atomic<size_t>& m_counter;
};

} // namespace

Application::Application(downloader::DownloadSettings settings, bool extractArchives)
    : m_settings(std::move(settings))
    , m_extractArchives(extractArchives) {
    Logger::instance().debug("Application instance created");
}

Application::~Application() {
    if (m_state != AppState::Uninitialized && m_state != AppState::ShuttingDown) {
        shutdown();
    }
    Logger::instance().debug("Application instance destroyed");
}

bool Application::initialize() {
    if (m_state != AppState::Uninitialized) {
        Logger::instance().warn("Application already initialized");
        return false;
    }

    setState(AppState::Initializing);
    Logger::instance().info("Initializing application...");

    auto startTime = std::chrono::steady_clock::now();

    if (!initializeEngine()) {
        Logger::instance().error("Failed to initialize transfer engine");
        setState(AppState::Error);
        return false;
    }

    if (!initializeDownloader()) {
        Logger::instance().error("Failed to initialize downloader");
        setState(AppState::Error);
        return false;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    Logger::instance().info("Application initialized in {}ms", duration.count());

    setState(AppState::Ready);
    m_events.emit("app.initialized", {{"version", getVersion()}});
    return true;
}

void Application::shutdown() {
    if (m_state == AppState::ShuttingDown || m_state == AppState::Uninitialized) {
        return;
    }

    setState(AppState::ShuttingDown);
    Logger::instance().info("Shutting down application...");

    // Detach the manager first so no engine event reaches a dying manager
    if (m_downloadManager) {
        m_downloadManager->shutdown();
    }
    m_downloadManager.reset();
    m_feedback.reset();
    m_extractor.reset();

    // Suspends running transfers and records them in the session journal
    m_engine.reset();
    utils::CurlGlobalInit::cleanup();

    m_events.emit("app.shutdown", {});
    Logger::instance().info("Application shutdown complete");

    setState(AppState::Uninitialized);
}

void Application::setState(AppState state) {
    auto previous = m_state.exchange(state);
    if (previous != state) {
        Logger::instance().debug("Application state {} -> {}",
                                 static_cast<int>(previous), static_cast<int>(state));
    }
}

bool Application::initializeEngine() {
    try {
        m_engine = downloader::CurlTransferEngine::create(m_settings);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Transfer engine initialization error: {}", e.what());
        return false;
    }
}

bool Application::initializeDownloader() {
    try {
        if (m_extractArchives) {
            m_extractor = std::make_shared<archive::ArchiveExtractor>();
        }
        m_feedback = std::make_shared<LoggingFailureFeedback>(m_failures);

        m_downloadManager = std::make_shared<downloader::DownloadManager>(
            m_engine, m_settings, m_events, m_extractor, m_feedback);
        m_downloadManager->initialize();

        // Pick up transfers a previous run left in the session
        m_downloadManager->reconcile();
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("Downloader initialization error: {}", e.what());
        return false;
    }
}

} // namespace hauler::core
