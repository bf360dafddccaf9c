/**
 * FileUtils.cpp
 *
 * Cross-platform file system operations.
 */

#include "FileUtils.hpp"

#include <fstream>
#include <random>

namespace hauler::utils {

// -- Directory operations --

bool FileUtils::createDirectories(const fs::path& path) {
    std::error_code ec;
    return createDirectories(path, ec);
}

bool FileUtils::createDirectories(const fs::path& path, std::error_code& ec) {
    ec.clear();
    if (fs::is_directory(path, ec)) return true;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

bool FileUtils::directoryExists(const fs::path& path) { std::error_code ec; return fs::is_directory(path, ec); }

// -- File operations --

bool FileUtils::fileExists(const fs::path& path) { std::error_code ec; return fs::is_regular_file(path, ec); }

bool FileUtils::moveFile(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    return moveFile(source, destination, ec);
}

bool FileUtils::moveFile(const fs::path& source, const fs::path& destination, std::error_code& ec) {
    ec.clear();
    fs::rename(source, destination, ec);
    if (!ec) return true;

    // rename() cannot cross filesystems; fall back to copy + remove
    if (ec != std::errc::cross_device_link) return false;

    ec.clear();
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) return false;

    fs::remove(source, ec);
    return !ec;
}

bool FileUtils::removeFileIfExists(const fs::path& path, std::error_code& ec) {
    ec.clear();
    if (!fs::exists(path, ec)) {
        return !ec;
    }
    fs::remove(path, ec);
    return !ec;
}

int64_t FileUtils::getFileSize(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<int64_t>(size);
}

// -- Read/Write --

std::optional<std::string> FileUtils::readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool FileUtils::writeFile(const fs::path& path, const std::string& content) {
    if (path.has_parent_path()) createDirectories(path.parent_path());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return false;
    file << content;
    return static_cast<bool>(file);
}

bool FileUtils::writeFileAtomic(const fs::path& path, const std::string& content) {
    fs::path temp = path;
    temp += ".tmp";
    if (!writeFile(temp, content)) return false;

    std::error_code ec;
    fs::rename(temp, path, ec);
    if (ec) {
        fs::remove(temp, ec);
        return false;
    }
    return true;
}

// -- Temp files --

fs::path FileUtils::createTempDirectory(const std::string& prefix) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) base = fs::current_path();

    std::random_device rd;
    for (int attempt = 0; attempt < 16; ++attempt) {
        auto candidate = base / (prefix + std::to_string(rd()));
        if (fs::create_directory(candidate, ec) && !ec) {
            return candidate;
        }
    }
    return {};
}

} // namespace hauler::utils
