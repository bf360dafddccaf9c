/**
 * SessionJournal.cpp
 */

#include "SessionJournal.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"

#include <nlohmann/json.hpp>

namespace hauler::core::downloader {

using json = nlohmann::json;

namespace {

constexpr int kJournalVersion = 1;

} // namespace

SessionJournal::SessionJournal(std::filesystem::path directory, std::string sessionIdentifier)
    : m_path(std::move(directory) / (sessionIdentifier + ".json")) {
}

size_t SessionJournal::load() {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_entries.clear();
    m_nextIdentifier = 1;

    auto content = utils::FileUtils::readFile(m_path);
    if (!content) return 0;

    try {
        auto j = json::parse(*content);

        if (j.value("version", 0) != kJournalVersion) {
            Logger::instance().warn("Ignoring session journal {} with unknown version", m_path.string());
            return 0;
        }

        m_nextIdentifier = j.value("nextIdentifier", uint64_t(1));

        for (const auto& item : j.value("tasks", json::array())) {
            JournalEntry entry;
            entry.identifier = item.at("identifier").get<uint64_t>();
            entry.url = item.at("url").get<std::string>();
            entry.running = item.value("running", false);
            entry.finished = item.value("finished", false);
            entry.bytesExpected = item.value("bytesExpected", int64_t(0));
            entry.etag = item.value("etag", "");
            entry.lastModified = item.value("lastModified", "");
            entry.suggestedFilename = item.value("suggestedFilename", "");

            if (entry.identifier >= m_nextIdentifier) {
                m_nextIdentifier = entry.identifier + 1;
            }
            m_entries[entry.identifier] = std::move(entry);
        }
    } catch (const json::exception& e) {
        Logger::instance().warn("Failed to load session journal {}: {}", m_path.string(), e.what());
        m_entries.clear();
    }

    return m_entries.size();
}

std::vector<JournalEntry> SessionJournal::entries() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<JournalEntry> result;
    result.reserve(m_entries.size());
    for (const auto& [identifier, entry] : m_entries) {
        result.push_back(entry);
    }
    return result;
}

uint64_t SessionJournal::nextIdentifier() {
    std::lock_guard<std::mutex> lock(m_mutex);
    uint64_t identifier = m_nextIdentifier++;
    saveLocked();
    return identifier;
}

void SessionJournal::put(const JournalEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[entry.identifier] = entry;
    if (entry.identifier >= m_nextIdentifier) {
        m_nextIdentifier = entry.identifier + 1;
    }
    saveLocked();
}

void SessionJournal::remove(uint64_t identifier) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_entries.erase(identifier) > 0) {
        saveLocked();
    }
}

bool SessionJournal::save() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return saveLocked();
}

bool SessionJournal::saveLocked() const {
    json tasks = json::array();
    for (const auto& [identifier, entry] : m_entries) {
        tasks.push_back({
            {"identifier", entry.identifier},
            {"url", entry.url},
            {"running", entry.running},
            {"finished", entry.finished},
            {"bytesExpected", entry.bytesExpected},
            {"etag", entry.etag},
            {"lastModified", entry.lastModified},
            {"suggestedFilename", entry.suggestedFilename}
        });
    }

    json j = {
        {"version", kJournalVersion},
        {"nextIdentifier", m_nextIdentifier},
        {"tasks", tasks}
    };

    if (!utils::FileUtils::createDirectories(m_path.parent_path())
        || !utils::FileUtils::writeFileAtomic(m_path, j.dump(2))) {
        Logger::instance().warn("Failed to save session journal {}", m_path.string());
        return false;
    }
    return true;
}

} // namespace hauler::core::downloader
