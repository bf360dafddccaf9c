#pragma once

/**
 * ArchiveExtractor.hpp
 *
 * Unpacks zip-format artifacts (.zip, .ipa, ...) with libzip.
 */

#include "../downloader/ArtifactPipeline.hpp"

#include <filesystem>
#include <string>

namespace hauler::core::archive {

/**
 * ArchiveExtractor - artifact pipeline that unpacks zip archives
 *
 * Every entry of the archive lands below <artifact dir>/<directoryName>/.
 * Entries whose path would leave that directory fail the whole extraction.
 * Artifacts that are not zip archives pass through untouched.
 */
class ArchiveExtractor : public downloader::ArtifactPipeline {
public:
    explicit ArchiveExtractor(std::string directoryName = "extracted");

    downloader::MaybeError handleArtifact(const std::filesystem::path& path,
                                          const downloader::DownloadSnapshot& download,
                                          const downloader::UnpackProgressFn& reportProgress) override;

    /**
     * Extract archive into destination (created if missing, emptied if not).
     * @param reportProgress Called after each entry with the fraction done
     */
    downloader::MaybeError extract(const std::filesystem::path& archive,
                                   const std::filesystem::path& destination,
                                   const downloader::UnpackProgressFn& reportProgress) const;

    /**
     * Sniff the local file header signature
     */
    static bool isZipArchive(const std::filesystem::path& path);

    /**
     * Resolve an entry name below root.
     * @return false if the entry is absolute or climbs out of root
     */
    static bool resolveEntryPath(const std::filesystem::path& root,
                                 const std::string& entryName,
                                 std::filesystem::path& resolved);

    const std::string& directoryName() const { return m_directoryName; }

private:
    std::string m_directoryName;
};

} // namespace hauler::core::archive
