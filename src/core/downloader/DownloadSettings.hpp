#pragma once

/**
 * DownloadSettings.hpp
 *
 * Settings the download manager and transfer engine are constructed with.
 */

#include <chrono>
#include <filesystem>
#include <string>

namespace hauler::core {
class Config;
}

namespace hauler::core::downloader {

struct DownloadSettings {
    // Where finished artifacts are moved before post-processing
    std::filesystem::path workDirectory;

    // Ids containing this marker belong to manually triggered downloads
    std::string manualMarker{"HaulerManualDownload"};

    // Engine. The identifier names the session directory and journal file.
    std::string sessionIdentifier{"hauler.downloads"};
    std::filesystem::path sessionDirectory;
    size_t maxConcurrent{4};
    int timeoutSeconds{0};         // 0 = unbounded
    int connectTimeoutSeconds{30};
    std::string userAgent{"Hauler/1.0"};

    // 0 when unbounded; 64-bit, so large configured values cannot overflow
    std::chrono::milliseconds requestTimeout() const {
        return std::chrono::seconds(timeoutSeconds);
    }
    std::chrono::milliseconds connectTimeout() const {
        return std::chrono::seconds(connectTimeoutSeconds);
    }

    /**
     * Read the "downloads" and "session" sections, resolving empty
     * directories to the platform defaults.
     */
    static DownloadSettings fromConfig(const Config& config);
};

} // namespace hauler::core::downloader
