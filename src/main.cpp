/**
 * Hauler - resumable background downloader
 *
 * Main entry point for the command line tool.
 * Reconciles with the transfer session of a previous run, starts the
 * requested downloads and reports their progress until all of them are
 * handed off.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/archive/ArchiveExtractor.hpp"
#include "core/downloader/DownloadManager.hpp"
#include "utils/FileUtils.hpp"
#include "utils/PathUtils.hpp"
#include "utils/StringUtils.hpp"
#include "utils/UrlUtils.hpp"

namespace fs = std::filesystem;

using hauler::core::Application;
using hauler::core::Config;
using hauler::core::Logger;
using hauler::core::LogLevel;
using hauler::core::downloader::DownloadSettings;

namespace {

std::atomic<bool> g_stopRequested{false};

/**
 * Signal handler: only flags the request, the main loop pauses transfers
 */
void signalHandler(int) {
    g_stopRequested = true;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

struct Options {
    bool debug{false};
    bool extract{true};
    std::string configPath;
    std::vector<std::string> overrides;
    std::vector<std::string> urls;
    std::vector<std::string> archives;
};

void printUsage(const char* program) {
    std::cout << "Hauler - resumable background downloader\n"
              << "\nUsage: " << program << " [options] <url>...\n"
              << "\nOptions:\n"
              << "  -d, --debug             Enable debug logging\n"
              << "  -c, --config <file>     Use this configuration file\n"
              << "  -s, --set <key=value>   Override a configuration value (repeatable)\n"
              << "  -u, --unpack <archive>  Unpack a local archive (repeatable)\n"
              << "      --no-extract        Keep downloaded archives packed\n"
              << "  -h, --help              Show this help message\n"
              << "  -v, --version           Show version information\n"
              << std::endl;
}

/**
 * @return exit code to stop with, or -1 to continue
 */
int parseArguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--config" || arg == "-c") {
            if (++i >= argc) {
                std::cerr << "Missing file after " << arg << std::endl;
                return 2;
            }
            options.configPath = argv[i];
        } else if (arg == "--set" || arg == "-s") {
            if (++i >= argc) {
                std::cerr << "Missing key=value after " << arg << std::endl;
                return 2;
            }
            options.overrides.emplace_back(argv[i]);
        } else if (arg == "--unpack" || arg == "-u") {
            if (++i >= argc) {
                std::cerr << "Missing archive after " << arg << std::endl;
                return 2;
            }
            options.archives.emplace_back(argv[i]);
        } else if (arg == "--no-extract") {
            options.extract = false;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << Application::getName() << " v" << Application::getVersion() << std::endl;
            return 0;
        } else if (hauler::utils::StringUtils::startsWith(arg, "-")) {
            std::cerr << "Unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        } else {
            options.urls.push_back(arg);
        }
    }
    return -1;
}

/**
 * Load the configuration file (created with defaults on first run), then
 * apply the --set overrides on top
 */
bool loadConfiguration(const Options& options, std::string& message) {
    auto& config = Config::instance();

    fs::path configPath = options.configPath.empty()
        ? hauler::utils::PathUtils::getConfigPath()
        : fs::path(options.configPath);

    switch (config.loadOrCreate(configPath)) {
        case Config::Source::File:
            message = "Configuration loaded from " + configPath.string();
            break;
        case Config::Source::Created:
            message = "Default configuration created at " + configPath.string();
            break;
        case Config::Source::Defaults:
            message = "Using default configuration (cannot write " + configPath.string() + ")";
            break;
        case Config::Source::Invalid:
            message = "Cannot parse configuration " + configPath.string();
            return false;
    }

    for (const auto& assignment : options.overrides) {
        if (!config.apply(assignment)) {
            message = "Invalid override '" + assignment + "', expected key=value";
            return false;
        }
    }
    return true;
}

hauler::core::LogOptions loggingOptions(const Options& options) {
    const auto& config = Config::instance();

    hauler::core::LogOptions logging;
    logging.level = options.debug
        ? LogLevel::Debug
        : Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    logging.directory = hauler::utils::PathUtils::resolve(
        config.get<std::string>("logging.directory", ""),
        hauler::utils::PathUtils::getLogsPath());
    logging.maxFileSize = static_cast<size_t>(std::max(1, config.get<int>("logging.maxFileSizeMB", 10))) * 1024 * 1024;
    logging.maxFiles = static_cast<size_t>(std::max(1, config.get<int>("logging.maxFiles", 5)));
    logging.console = config.get<bool>("logging.console", true);
    return logging;
}

void printProgress(const nlohmann::json& download) {
    std::string name = download.value("fileName", "");
    double overall = download.value("overallProgress", 0.0);
    int64_t received = download.value("bytesDownloaded", int64_t(0));
    int64_t total = download.value("totalBytes", int64_t(0));

    std::cout << "  " << name << "  "
              << hauler::utils::StringUtils::formatPercentage(overall) << "  "
              << hauler::utils::StringUtils::formatBytes(received);
    if (total > 0) {
        std::cout << " / " << hauler::utils::StringUtils::formatBytes(total);
    }
    std::cout << std::endl;
}

/**
 * Unpack local archives as archive-only units
 */
void unpackArchives(Application& app, const std::vector<std::string>& archives) {
    auto manager = app.getDownloadManager();
    auto extractor = app.getArchiveExtractor();

    for (const auto& archive : archives) {
        if (g_stopRequested) break;

        fs::path path(archive);
        if (!hauler::utils::FileUtils::fileExists(path)) {
            LOG_ERROR("No such archive: {}", archive);
            continue;
        }
        if (!extractor) {
            LOG_WARN("Extraction is disabled, skipping {}", archive);
            continue;
        }

        auto unit = manager->startArchive(archive);
        auto destination = manager->settings().workDirectory
            / hauler::utils::StringUtils::sanitizeFileName(unit.id)
            / extractor->directoryName();

        auto error = extractor->extract(path, destination, [&manager, &unit](double progress) {
            manager->setUnpackProgress(unit.id, progress);
        });
        if (error) {
            LOG_ERROR("Unpacking {} failed: {}", archive, error->reason);
        } else {
            Logger::instance().info("Unpacked {} into {}", archive, destination.string());
        }
        manager->removeDownload(unit.id);
    }
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    Options options;
    int exitCode = parseArguments(argc, argv, options);
    if (exitCode >= 0) {
        return exitCode;
    }

    std::string configMessage;
    bool configLoaded = loadConfiguration(options, configMessage);
    auto& config = Config::instance();

    Logger::instance().initialize(loggingOptions(options));

    auto& logger = Logger::instance();
    logger.info("{} v{} starting...", Application::getName(), Application::getVersion());

    if (!configLoaded) {
        logger.critical("{}", configMessage);
        return 1;
    }
    logger.info("{}", configMessage);

    if (options.urls.empty() && options.archives.empty()) {
        logger.info("Nothing requested; resuming transfers of the previous session only");
    }

    setupSignalHandlers();

    try {
        auto settings = DownloadSettings::fromConfig(config);
        bool extract = options.extract && config.get<bool>("downloads.extractArchives", true);

        Application app(settings, extract);

        app.events().subscribe("download.*", [](const std::string& event, const nlohmann::json& data) {
            if (event == hauler::core::downloader::kEventDownloadAdded) {
                std::cout << "+ " << data.value("fileName", "") << "  (" << data.value("url", "") << ")" << std::endl;
            } else if (event == hauler::core::downloader::kEventDownloadUpdated) {
                printProgress(data);
            } else if (event == hauler::core::downloader::kEventDownloadFailed) {
                std::cerr << "! " << data.value("reason", "unknown error") << std::endl;
            }
        });

        if (!app.initialize()) {
            logger.critical("Failed to initialize application");
            return 1;
        }

        auto manager = app.getDownloadManager();

        for (const auto& url : options.urls) {
            if (!hauler::utils::UrlUtils::isTransferUrl(url)) {
                logger.error("Not a downloadable url: {}", url);
                continue;
            }
            manager->startDownload(url);
        }

        unpackArchives(app, options.archives);

        // Transfers adopted from the previous session were paused by it
        manager->waitForIdle();
        manager->resumeAll();

        while (!g_stopRequested && manager->size() > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (g_stopRequested) {
            logger.info("Interrupted; pausing {} transfer(s) for the next run", manager->size());
            manager->pauseAll();
        } else {
            manager->waitForIdle();
        }

        size_t failures = app.failureCount();
        app.shutdown();

        logger.info("{} shutdown complete", Application::getName());
        return failures > 0 ? 1 : 0;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
