/**
 * ResponseHead.cpp
 */

#include "ResponseHead.hpp"
#include "../../utils/StringUtils.hpp"

#include <cstdlib>

namespace hauler::core::downloader {

using utils::StringUtils;

namespace {

int64_t parseInt64(const std::string& value) {
    char* end = nullptr;
    long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (end == value.c_str()) return -1;
    return static_cast<int64_t>(parsed);
}

} // namespace

void ResponseHead::reset() {
    *this = ResponseHead{};
}

bool ResponseHead::parseLine(const std::string& line) {
    std::string text = StringUtils::trim(line);

    if (StringUtils::startsWith(text, "HTTP/")) {
        reset();
        auto parts = StringUtils::split(text, ' ');
        if (parts.size() >= 2) {
            m_status = static_cast<long>(parseInt64(parts[1]));
        }
        return false;
    }

    if (text.empty()) {
        return isSuccess();
    }

    auto colon = text.find(':');
    if (colon == std::string::npos) return false;

    std::string name = StringUtils::toLower(StringUtils::trim(text.substr(0, colon)));
    std::string value = StringUtils::trim(text.substr(colon + 1));

    if (name == "content-length") {
        m_contentLength = parseInt64(value);
    } else if (name == "content-range") {
        m_rangeTotal = parseRangeTotal(value);
    } else if (name == "etag") {
        m_etag = value;
    } else if (name == "last-modified") {
        m_lastModified = value;
    } else if (name == "content-disposition") {
        m_disposition = value;
    }
    return false;
}

bool ResponseHead::restartsFrom(int64_t offset) const {
    return m_status == 200 && offset > 0;
}

int64_t ResponseHead::expectedSize(int64_t offset) const {
    if (m_status == 206) {
        if (m_rangeTotal > 0) return m_rangeTotal;
        if (m_contentLength >= 0) return offset + m_contentLength;
        return 0;
    }
    return m_contentLength > 0 ? m_contentLength : 0;
}

int64_t ResponseHead::parseRangeTotal(const std::string& value) {
    auto slash = value.rfind('/');
    if (slash == std::string::npos) return -1;
    return parseInt64(value.substr(slash + 1));
}

std::string ResponseHead::ifRangeValidator(const std::string& etag, const std::string& lastModified) {
    return !etag.empty() ? etag : lastModified;
}

std::string ResponseHead::failureReason(long statusCode) {
    if (statusCode >= 400) {
        return "HTTP " + std::to_string(statusCode);
    }
    return {};
}

} // namespace hauler::core::downloader
