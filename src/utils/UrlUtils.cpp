/**
 * UrlUtils.cpp
 *
 * URL parsing helpers. Percent-decoding goes through libcurl.
 */

#include "UrlUtils.hpp"
#include "StringUtils.hpp"

#include <curl/curl.h>
#include <mutex>

namespace hauler::utils {

// -- CurlGlobalInit --

bool CurlGlobalInit::s_initialized = false;

namespace {
std::mutex g_curlInitMutex;
}

void CurlGlobalInit::init() {
    std::lock_guard<std::mutex> lock(g_curlInitMutex);
    if (!s_initialized) {
        curl_global_init(CURL_GLOBAL_ALL);
        s_initialized = true;
    }
}

void CurlGlobalInit::cleanup() {
    std::lock_guard<std::mutex> lock(g_curlInitMutex);
    if (s_initialized) {
        curl_global_cleanup();
        s_initialized = false;
    }
}

// -- UrlUtils --

std::optional<UrlParts> UrlUtils::parse(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = StringUtils::toLower(url.substr(0, schemeEnd));

    std::string rest = url.substr(schemeEnd + 3);

    auto hashPos = rest.find('#');
    if (hashPos != std::string::npos) {
        parts.fragment = rest.substr(hashPos + 1);
        rest.erase(hashPos);
    }

    auto queryPos = rest.find('?');
    if (queryPos != std::string::npos) {
        parts.query = rest.substr(queryPos + 1);
        rest.erase(queryPos);
    }

    auto pathPos = rest.find('/');
    if (pathPos == std::string::npos) {
        parts.host = rest;
    } else {
        parts.host = rest.substr(0, pathPos);
        parts.path = rest.substr(pathPos);
    }

    // Drop userinfo
    auto at = parts.host.rfind('@');
    if (at != std::string::npos) {
        parts.host.erase(0, at + 1);
    }

    return parts;
}

bool UrlUtils::isTransferUrl(const std::string& url) {
    auto parts = parse(url);
    if (!parts) return false;
    if (parts->scheme != "http" && parts->scheme != "https" && parts->scheme != "ftp") {
        return false;
    }
    return !parts->host.empty();
}

std::string UrlUtils::urlDecode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) return str;
    int outLen = 0;
    char* output = curl_easy_unescape(curl, str.c_str(), static_cast<int>(str.size()), &outLen);
    if (!output) {
        curl_easy_cleanup(curl);
        return str;
    }
    std::string result(output, static_cast<size_t>(outLen));
    curl_free(output);
    curl_easy_cleanup(curl);
    return result;
}

std::string UrlUtils::lastPathComponent(const std::string& url) {
    std::string path;
    std::string host;

    if (auto parts = parse(url)) {
        path = parts->path;
        host = parts->host;
    } else {
        // Plain filesystem path
        path = url;
    }

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    auto slash = path.rfind('/');
    std::string segment = slash == std::string::npos ? path : path.substr(slash + 1);
    segment = urlDecode(segment);

    if (!segment.empty()) return segment;
    if (!host.empty()) return host;
    return "download";
}

std::optional<std::string> UrlUtils::fileNameFromContentDisposition(const std::string& value) {
    std::optional<std::string> plain;
    std::optional<std::string> extended;

    for (auto& rawParam : StringUtils::split(value, ';')) {
        std::string param = StringUtils::trim(rawParam);
        auto eq = param.find('=');
        if (eq == std::string::npos) continue;

        std::string key = StringUtils::toLower(StringUtils::trim(param.substr(0, eq)));
        std::string val = StringUtils::trim(param.substr(eq + 1));

        if (key == "filename*") {
            // charset'lang'percent-encoded
            auto quote = val.find('\'');
            if (quote != std::string::npos) {
                auto second = val.find('\'', quote + 1);
                if (second != std::string::npos) {
                    extended = urlDecode(val.substr(second + 1));
                }
            }
        } else if (key == "filename") {
            if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
                val = val.substr(1, val.size() - 2);
            }
            plain = val;
        }
    }

    auto chosen = extended ? extended : plain;
    if (!chosen || StringUtils::trim(*chosen).empty()) {
        return std::nullopt;
    }

    // Never trust directory components from the server
    std::string name = *chosen;
    auto slash = name.find_last_of("/\\");
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    return StringUtils::sanitizeFileName(name);
}

} // namespace hauler::utils
