// Hauler - URL Utilities
// URL parsing helpers built on libcurl

#pragma once

#include <optional>
#include <string>

namespace hauler::utils {

/**
 * @brief Pieces of an absolute URL
 */
struct UrlParts {
    std::string scheme;   // lower-cased, without "://"
    std::string host;     // may include ":port"
    std::string path;     // starts with '/' or is empty
    std::string query;    // without '?'
    std::string fragment; // without '#'
};

/**
 * @brief URL helpers
 */
class UrlUtils {
public:
    static std::optional<UrlParts> parse(const std::string& url);

    // Only http, https and ftp URLs with a host are accepted for transfers
    static bool isTransferUrl(const std::string& url);

    static std::string urlDecode(const std::string& str);

    /**
     * Last non-empty path segment, percent-decoded. Falls back to the host
     * and then to "download" for URLs without a usable path.
     */
    static std::string lastPathComponent(const std::string& url);

    /**
     * File name from a Content-Disposition header value. Understands both
     * filename="..." and the RFC 5987 filename*=UTF-8''... form.
     */
    static std::optional<std::string> fileNameFromContentDisposition(const std::string& value);
};

/**
 * @brief Global CURL initialization
 */
class CurlGlobalInit {
public:
    static void init();
    static void cleanup();

private:
    static bool s_initialized;
};

} // namespace hauler::utils
