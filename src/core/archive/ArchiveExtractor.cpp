/**
 * ArchiveExtractor.cpp
 */

#include "ArchiveExtractor.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <zip.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <vector>

namespace hauler::core::archive {

using downloader::DownloadError;
using downloader::MaybeError;
using utils::FileUtils;

namespace {

constexpr size_t kReadBufferSize = 64 * 1024;

std::string openErrorMessage(int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    return message;
}

} // namespace

ArchiveExtractor::ArchiveExtractor(std::string directoryName)
    : m_directoryName(std::move(directoryName)) {
}

MaybeError ArchiveExtractor::handleArtifact(const std::filesystem::path& path,
                                            const downloader::DownloadSnapshot& download,
                                            const downloader::UnpackProgressFn& reportProgress) {
    if (!isZipArchive(path)) {
        Logger::instance().info("{} is not an archive, nothing to unpack", path.filename().string());
        if (reportProgress) reportProgress(1.0);
        return std::nullopt;
    }

    auto destination = path.parent_path() / m_directoryName;
    Logger::instance().info("Unpacking {} for download {}", path.filename().string(), download.id);

    auto error = extract(path, destination, reportProgress);
    if (error) {
        Logger::instance().error("Unpacking {} failed: {}", path.string(), error->reason);
        return error;
    }

    Logger::instance().info("Unpacked {} into {}", path.filename().string(), destination.string());
    return std::nullopt;
}

MaybeError ArchiveExtractor::extract(const std::filesystem::path& archivePath,
                                     const std::filesystem::path& destination,
                                     const downloader::UnpackProgressFn& reportProgress) const {
    int err = 0;
    zip_t* archive = zip_open(archivePath.string().c_str(), ZIP_RDONLY, &err);
    if (!archive) {
        return DownloadError::pipelineFailed("cannot open " + archivePath.string() + ": " + openErrorMessage(err));
    }

    auto fail = [archive](std::string reason) -> MaybeError {
        zip_discard(archive);
        return DownloadError::pipelineFailed(std::move(reason));
    };

    std::error_code ec;
    if (FileUtils::directoryExists(destination)) {
        std::filesystem::remove_all(destination, ec);
        if (ec) {
            return fail("cannot clear " + destination.string() + ": " + ec.message());
        }
    }
    if (!FileUtils::createDirectories(destination, ec)) {
        return fail("cannot create " + destination.string() + ": " + ec.message());
    }

    zip_int64_t count = zip_get_num_entries(archive, 0);
    if (count < 0) {
        return fail(std::string("cannot list entries: ") + zip_strerror(archive));
    }

    std::vector<char> buffer(kReadBufferSize);

    for (zip_int64_t index = 0; index < count; ++index) {
        zip_stat_t stat;
        zip_stat_init(&stat);
        if (zip_stat_index(archive, static_cast<zip_uint64_t>(index), 0, &stat) != 0 || !stat.name) {
            return fail(std::string("cannot read entry: ") + zip_strerror(archive));
        }

        std::string name = stat.name;
        std::filesystem::path target;
        if (!resolveEntryPath(destination, name, target)) {
            return fail("entry escapes the destination: " + name);
        }

        if (!name.empty() && name.back() == '/') {
            if (!FileUtils::createDirectories(target, ec)) {
                return fail("cannot create " + target.string() + ": " + ec.message());
            }
        } else {
            if (!FileUtils::createDirectories(target.parent_path(), ec)) {
                return fail("cannot create " + target.parent_path().string() + ": " + ec.message());
            }

            zip_file_t* file = zip_fopen_index(archive, static_cast<zip_uint64_t>(index), 0);
            if (!file) {
                return fail("cannot open entry " + name + ": " + zip_strerror(archive));
            }

            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                zip_fclose(file);
                return fail("cannot write " + target.string());
            }

            zip_int64_t read = 0;
            while ((read = zip_fread(file, buffer.data(), buffer.size())) > 0) {
                out.write(buffer.data(), static_cast<std::streamsize>(read));
                if (!out) break;
            }

            std::string fileError = read < 0 ? zip_file_strerror(file) : "";
            zip_fclose(file);
            out.close();

            if (read < 0) {
                return fail("cannot inflate " + name + ": " + fileError);
            }
            if (!out) {
                return fail("cannot write " + target.string());
            }
        }

        if (reportProgress) {
            reportProgress(static_cast<double>(index + 1) / static_cast<double>(count));
        }
    }

    zip_discard(archive);

    if (count == 0 && reportProgress) {
        reportProgress(1.0);
    }

    LOG_DEBUG("Extracted {} entries from {}", count, archivePath.filename().string());
    return std::nullopt;
}

bool ArchiveExtractor::isZipArchive(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return false;

    std::array<char, 4> magic{};
    file.read(magic.data(), static_cast<std::streamsize>(magic.size()));
    if (file.gcount() != static_cast<std::streamsize>(magic.size())) return false;

    // Local file header, or the end record of an empty archive
    return magic[0] == 'P' && magic[1] == 'K'
        && ((magic[2] == '\x03' && magic[3] == '\x04') || (magic[2] == '\x05' && magic[3] == '\x06'));
}

bool ArchiveExtractor::resolveEntryPath(const std::filesystem::path& root,
                                        const std::string& entryName,
                                        std::filesystem::path& resolved) {
    if (entryName.empty()) return false;

    std::filesystem::path entry(entryName);
    if (entry.is_absolute() || entry.has_root_name() || entry.has_root_directory()) {
        return false;
    }

    auto base = root.lexically_normal();
    auto candidate = (base / entry).lexically_normal();

    // Every component of base must prefix candidate
    auto baseEnd = base.end();
    if (!base.empty() && base.filename().empty()) {
        --baseEnd; // trailing separator
    }
    auto mismatch = std::mismatch(base.begin(), baseEnd, candidate.begin(), candidate.end());
    if (mismatch.first != baseEnd) {
        return false;
    }

    resolved = candidate;
    return true;
}

} // namespace hauler::core::archive
