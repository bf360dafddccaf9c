#pragma once

/**
 * ArtifactPipeline.hpp
 *
 * Collaborators the download manager hands finished transfers to.
 */

#include "Download.hpp"
#include "DownloadError.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace hauler::core::downloader {

/**
 * Reports unpack phase progress in [0,1] for the record being processed.
 * Safe to call from any thread.
 */
using UnpackProgressFn = std::function<void(double progress)>;

/**
 * Post-processing of a downloaded artifact (unpack, install, ...)
 */
class ArtifactPipeline {
public:
    virtual ~ArtifactPipeline() = default;

    /**
     * Process the artifact at path. Runs on a worker thread.
     * @return std::nullopt on success, the failure otherwise
     */
    virtual MaybeError handleArtifact(const std::filesystem::path& path,
                                      const DownloadSnapshot& download,
                                      const UnpackProgressFn& reportProgress) = 0;
};

/**
 * User-visible "operation failed" signal (notification, haptics, ...)
 */
class FailureFeedback {
public:
    virtual ~FailureFeedback() = default;

    virtual void operationFailed(const std::string& downloadId, const DownloadError& error) = 0;
};

} // namespace hauler::core::downloader
