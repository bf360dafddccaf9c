/**
 * ArtifactStore.cpp
 */

#include "ArtifactStore.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/StringUtils.hpp"

namespace hauler::core::downloader {

ArtifactStore::ArtifactStore(std::filesystem::path root)
    : m_root(std::move(root)) {
}

std::filesystem::path ArtifactStore::destinationFor(const std::string& downloadId,
                                                    const std::string& fileName) const {
    return m_root
        / utils::StringUtils::sanitizeFileName(downloadId)
        / utils::StringUtils::sanitizeFileName(fileName);
}

std::optional<std::filesystem::path> ArtifactStore::relocate(const std::filesystem::path& source,
                                                             const std::string& downloadId,
                                                             const std::string& fileName,
                                                             DownloadError& error) const {
    auto destination = destinationFor(downloadId, fileName);
    std::error_code ec;

    if (!utils::FileUtils::createDirectories(destination.parent_path(), ec)) {
        error = DownloadError::relocationFailed(
            "cannot create " + destination.parent_path().string() + ": " + ec.message());
        return std::nullopt;
    }

    if (!utils::FileUtils::removeFileIfExists(destination, ec)) {
        error = DownloadError::relocationFailed(
            "cannot replace " + destination.string() + ": " + ec.message());
        return std::nullopt;
    }

    if (!utils::FileUtils::moveFile(source, destination, ec)) {
        error = DownloadError::relocationFailed(
            "cannot move " + source.string() + " to " + destination.string() + ": " + ec.message());
        return std::nullopt;
    }

    LOG_DEBUG("Artifact for {} moved to {}", downloadId, destination.string());
    return destination;
}

} // namespace hauler::core::downloader
