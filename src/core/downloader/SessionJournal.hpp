#pragma once

/**
 * SessionJournal.hpp
 *
 * On-disk list of the transfers a CurlTransferEngine session owns, so that a
 * restarted process can re-attach to them under the same identifiers.
 */

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace hauler::core::downloader {

/**
 * Persisted state of one transfer
 */
struct JournalEntry {
    uint64_t identifier{0};
    std::string url;
    bool running{false};          // was running when last written
    bool finished{false};         // part file is complete, Finished not yet delivered
    int64_t bytesExpected{0};
    std::string etag;
    std::string lastModified;
    std::string suggestedFilename;
};

/**
 * SessionJournal - JSON file at <directory>/<identifier>.json
 *
 * Thread-safe. Every mutation is written through atomically; a journal that
 * cannot be written is logged and kept in memory.
 */
class SessionJournal {
public:
    SessionJournal(std::filesystem::path directory, std::string sessionIdentifier);

    const std::filesystem::path& path() const { return m_path; }

    /**
     * Read the journal from disk. A missing file is an empty session; a
     * corrupt one is logged and discarded.
     * @return number of entries loaded
     */
    size_t load();

    std::vector<JournalEntry> entries() const;

    /**
     * Allocate an identifier that was never handed out in this session
     */
    uint64_t nextIdentifier();

    void put(const JournalEntry& entry);
    void remove(uint64_t identifier);

    bool save() const;

private:
    bool saveLocked() const;

    std::filesystem::path m_path;
    std::map<uint64_t, JournalEntry> m_entries;
    uint64_t m_nextIdentifier{1};
    mutable std::mutex m_mutex;
};

} // namespace hauler::core::downloader
