#pragma once

/**
 * ArtifactStore.hpp
 *
 * Stable working location for finished artifacts. Each record gets its own
 * directory below the store root; an existing file with the same name is
 * replaced.
 */

#include "DownloadError.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace hauler::core::downloader {

class ArtifactStore {
public:
    explicit ArtifactStore(std::filesystem::path root);

    const std::filesystem::path& root() const { return m_root; }

    std::filesystem::path destinationFor(const std::string& downloadId,
                                         const std::string& fileName) const;

    /**
     * Move source into the record's working directory.
     * @param error Receives the failure if relocation fails
     * @return Final artifact path, or std::nullopt on failure
     */
    std::optional<std::filesystem::path> relocate(const std::filesystem::path& source,
                                                  const std::string& downloadId,
                                                  const std::string& fileName,
                                                  DownloadError& error) const;

private:
    std::filesystem::path m_root;
};

} // namespace hauler::core::downloader
