/**
 * DownloadSettings.cpp
 */

#include "DownloadSettings.hpp"
#include "../Config.hpp"
#include "../../utils/PathUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>

namespace hauler::core::downloader {

DownloadSettings DownloadSettings::fromConfig(const Config& config) {
    DownloadSettings settings;

    settings.workDirectory = utils::PathUtils::resolve(
        config.get<std::string>("downloads.workDirectory", ""),
        utils::PathUtils::getWorkPath());
    settings.manualMarker = config.get<std::string>("downloads.manualMarker", settings.manualMarker);

    // Used as a path segment; never let it leave the sessions directory
    std::string identifier = config.get<std::string>("session.identifier", "");
    if (!identifier.empty()) {
        settings.sessionIdentifier = utils::StringUtils::sanitizeFileName(identifier);
    }
    settings.sessionDirectory = utils::PathUtils::resolve(
        config.get<std::string>("session.directory", ""),
        utils::PathUtils::getSessionsPath()) / settings.sessionIdentifier;

    int maxConcurrent = config.get<int>("downloads.maxConcurrent", 4);
    settings.maxConcurrent = static_cast<size_t>(std::max(1, maxConcurrent));
    settings.timeoutSeconds = std::max(0, config.get<int>("downloads.timeout", 0));
    settings.connectTimeoutSeconds = std::max(0, config.get<int>("downloads.connectTimeout", 30));
    settings.userAgent = config.get<std::string>("downloads.userAgent", settings.userAgent);

    return settings;
}

} // namespace hauler::core::downloader
