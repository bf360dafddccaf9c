#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>

namespace hauler::utils {

namespace fs = std::filesystem;

/**
 * Default locations of the files Hauler keeps between runs. Setting
 * HAULER_HOME puts all of them below that one directory.
 */
class PathUtils {
public:
    static fs::path getConfigPath() {
        return baseDirectory("XDG_CONFIG_HOME", ".config") / "config.json";
    }

    static fs::path getLogsPath() {
        return baseDirectory("XDG_STATE_HOME", ".local/state") / "logs";
    }

    static fs::path getSessionsPath() {
        return baseDirectory("XDG_DATA_HOME", ".local/share") / "sessions";
    }

    // Transient area where finished artifacts are handed to the pipeline
    static fs::path getWorkPath() {
        std::error_code ec;
        fs::path temp = fs::temp_directory_path(ec);
        if (ec) {
            return baseDirectory("XDG_CACHE_HOME", ".cache") / "work";
        }
        return temp / "HaulerDownloads";
    }

    /**
     * Resolve a configured directory: empty means the given default
     */
    static fs::path resolve(const std::string& configured, const fs::path& fallback) {
        return configured.empty() ? fallback : fs::path(configured);
    }

private:
    static fs::path fromEnv(const char* name) {
        const char* value = std::getenv(name);
        return (value && *value) ? fs::path(value) : fs::path();
    }

    /**
     * @param xdgVariable XDG base directory variable for this kind of file
     * @param homeRelative Where that variable defaults to below $HOME
     */
    static fs::path baseDirectory(const char* xdgVariable, const char* homeRelative) {
        fs::path home = fromEnv("HAULER_HOME");
        if (!home.empty()) return home;

#ifdef _WIN32
        (void)xdgVariable;
        (void)homeRelative;
        fs::path appData = fromEnv("APPDATA");
        return (appData.empty() ? fs::current_path() : appData) / "Hauler";
#elif defined(__APPLE__)
        (void)xdgVariable;
        (void)homeRelative;
        fs::path user = fromEnv("HOME");
        return user.empty() ? fs::current_path() / "Hauler"
                            : user / "Library" / "Application Support" / "Hauler";
#else
        fs::path xdg = fromEnv(xdgVariable);
        if (!xdg.empty()) return xdg / "hauler";

        fs::path user = fromEnv("HOME");
        return (user.empty() ? fs::current_path() : user / homeRelative) / "hauler";
#endif
    }
};

} // namespace hauler::utils
