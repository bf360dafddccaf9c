#pragma once

/**
 * ResponseHead.hpp
 *
 * Header block of one HTTP response as libcurl reports it line by line,
 * and the decisions the transfer engine takes from it when it continues a
 * part file.
 */

#include <cstdint>
#include <string>

namespace hauler::core::downloader {

/**
 * ResponseHead - parser for the heads of one request
 *
 * A request that is redirected produces several heads; each status line
 * starts a new one, so after the last head only that head is visible.
 */
class ResponseHead {
public:
    /**
     * Feed one header line, with or without its line break
     * @return true when the line ends a 2xx head, i.e. the body that
     *         follows is the transfer payload
     */
    bool parseLine(const std::string& line);

    void reset();

    long status() const { return m_status; }
    int64_t contentLength() const { return m_contentLength; }   // -1 when absent
    int64_t rangeTotal() const { return m_rangeTotal; }         // -1 when absent or "*"
    const std::string& etag() const { return m_etag; }
    const std::string& lastModified() const { return m_lastModified; }
    const std::string& disposition() const { return m_disposition; }

    bool isSuccess() const { return m_status >= 200 && m_status < 300; }

    /**
     * True when offset bytes were requested to be skipped but the server
     * sends the whole entity (Range ignored, or If-Range did not match)
     */
    bool restartsFrom(int64_t offset) const;

    /**
     * Size of the complete file once this body is appended after offset
     * bytes already on disk
     * @return 0 while unknown
     */
    int64_t expectedSize(int64_t offset) const;

    /**
     * "bytes 100-199/1000" -> 1000, "bytes 100-199/*" -> -1
     */
    static int64_t parseRangeTotal(const std::string& value);

    /**
     * If-Range value for continuing a part file: the entity tag when one is
     * known, the modification date otherwise, empty when neither is
     */
    static std::string ifRangeValidator(const std::string& etag, const std::string& lastModified);

    /**
     * @return Failure reason for the final status of a request, empty when
     *         the status does not fail the transfer
     */
    static std::string failureReason(long statusCode);

private:
    long m_status{0};
    int64_t m_contentLength{-1};
    int64_t m_rangeTotal{-1};
    std::string m_etag;
    std::string m_lastModified;
    std::string m_disposition;
};

} // namespace hauler::core::downloader
