// Hauler - File Utilities
// Cross-platform file system operations

#pragma once

#include <string>
#include <filesystem>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace hauler::utils {

/**
 * @brief File and directory utilities
 *
 * Every operation reports failure through its return value; the
 * std::error_code overloads additionally say why.
 */
class FileUtils {
public:
    // Directory operations
    static bool createDirectories(const fs::path& path);
    static bool createDirectories(const fs::path& path, std::error_code& ec);
    static bool directoryExists(const fs::path& path);

    // File operations
    static bool fileExists(const fs::path& path);
    static bool moveFile(const fs::path& source, const fs::path& destination);
    static bool moveFile(const fs::path& source, const fs::path& destination, std::error_code& ec);

    /**
     * Remove a file if one exists at path.
     * @return true if nothing is left at path afterwards
     */
    static bool removeFileIfExists(const fs::path& path, std::error_code& ec);
    static int64_t getFileSize(const fs::path& path);

    // Read/Write operations
    static std::optional<std::string> readFile(const fs::path& path);
    static bool writeFile(const fs::path& path, const std::string& content);

    /**
     * Write through a sibling temporary file and rename it over path, so
     * readers never observe a half-written file.
     */
    static bool writeFileAtomic(const fs::path& path, const std::string& content);

    // Temporary files
    static fs::path createTempDirectory(const std::string& prefix = "hauler_");
};

} // namespace hauler::utils
