#pragma once

/**
 * DownloadError.hpp
 *
 * Error taxonomy shared by the transfer engine, the download manager and
 * the artifact pipeline. None of these errors is fatal to the process.
 */

#include <optional>
#include <string>

namespace hauler::core::downloader {

enum class DownloadErrorCode {
    // Resume requested with no continuation data and nothing to re-issue
    NoResumeDataAvailable,
    // Network or protocol failure of a transfer
    TransferFailed,
    // The transfer was cancelled (explicitly or to produce resume data)
    Cancelled,
    // Moving a finished artifact into its working location failed
    ArtifactRelocationFailed,
    // The post-processing pipeline rejected the artifact
    PipelineFailed
};

/**
 * Error value with a human readable reason
 */
struct DownloadError {
    DownloadErrorCode code{DownloadErrorCode::TransferFailed};
    std::string reason;

    static DownloadError noResumeData(std::string reason = "nothing to resume from") {
        return {DownloadErrorCode::NoResumeDataAvailable, std::move(reason)};
    }

    static DownloadError transferFailed(std::string reason) {
        return {DownloadErrorCode::TransferFailed, std::move(reason)};
    }

    static DownloadError cancelled() {
        return {DownloadErrorCode::Cancelled, "cancelled"};
    }

    static DownloadError relocationFailed(std::string reason) {
        return {DownloadErrorCode::ArtifactRelocationFailed, std::move(reason)};
    }

    static DownloadError pipelineFailed(std::string reason) {
        return {DownloadErrorCode::PipelineFailed, std::move(reason)};
    }

    bool isCancellation() const { return code == DownloadErrorCode::Cancelled; }
};

inline const char* toString(DownloadErrorCode code) {
    switch (code) {
        case DownloadErrorCode::NoResumeDataAvailable:    return "NoResumeDataAvailable";
        case DownloadErrorCode::TransferFailed:           return "TransferFailed";
        case DownloadErrorCode::Cancelled:                return "Cancelled";
        case DownloadErrorCode::ArtifactRelocationFailed: return "ArtifactRelocationFailed";
        case DownloadErrorCode::PipelineFailed:           return "PipelineFailed";
    }
    return "Unknown";
}

using MaybeError = std::optional<DownloadError>;

} // namespace hauler::core::downloader
