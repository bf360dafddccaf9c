#pragma once

/**
 * Config.hpp
 *
 * JSON settings file with dotted-key access ("downloads.timeout").
 * Values read from disk are merged over the built-in defaults, so a file
 * only needs the keys it changes.
 */

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace hauler::core {

using json = nlohmann::json;

/**
 * Config - process-wide settings, thread-safe
 */
class Config {
public:
    enum class Source {
        File,       // read from an existing file
        Created,    // file was missing, defaults were written to it
        Defaults,   // file was missing and could not be written
        Invalid     // file exists but is not a JSON object
    };

    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Built-in values for every key the application reads
     */
    static json defaults() {
        return {
            {"downloads", {
                {"workDirectory", ""},
                {"maxConcurrent", 4},
                {"timeout", 0},
                {"connectTimeout", 30},
                {"userAgent", "Hauler/1.0"},
                {"manualMarker", "HaulerManualDownload"},
                {"extractArchives", true}
            }},
            {"session", {
                {"identifier", "hauler.downloads"},
                {"directory", ""}
            }},
            {"logging", {
                {"level", "info"},
                {"directory", ""},
                {"maxFileSizeMB", 10},
                {"maxFiles", 5},
                {"console", true}
            }}
        };
    }

    /**
     * Drop every override and go back to defaults()
     */
    void reset() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_values = defaults();
        m_path.clear();
    }

    /**
     * Merge a file over the current values
     * @return false if the file is missing or is not a JSON object; the
     *         current values are untouched in that case
     */
    bool load(const std::filesystem::path& path) {
        json loaded;
        try {
            std::ifstream in(path);
            if (!in) return false;
            loaded = json::parse(in);
        } catch (const json::parse_error&) {
            return false;
        }
        if (!loaded.is_object()) return false;

        std::lock_guard<std::mutex> lock(m_mutex);
        m_values.merge_patch(loaded);
        m_path = path;
        return true;
    }

    /**
     * Load path, or write the defaults there when it does not exist yet
     */
    Source loadOrCreate(const std::filesystem::path& path) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            return load(path) ? Source::File : Source::Invalid;
        }

        reset();
        return save(path) ? Source::Created : Source::Defaults;
    }

    /**
     * Write the current values as indented JSON
     * @param path Target file; empty means the file last loaded or saved
     */
    bool save(const std::filesystem::path& path = {}) {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::filesystem::path target = path.empty() ? m_path : path;
        if (target.empty()) return false;

        std::error_code ec;
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path(), ec);
        }

        std::ofstream out(target, std::ios::trunc);
        if (!out) return false;
        out << m_values.dump(4) << '\n';
        if (!out) return false;

        m_path = target;
        return true;
    }

    /**
     * Apply a "key=value" override such as "downloads.maxConcurrent=2".
     * The value is taken as JSON when it parses, as a plain string otherwise.
     * @return false if there is no '=' or the key is empty
     */
    bool apply(const std::string& assignment) {
        auto eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0) return false;

        std::string key = assignment.substr(0, eq);
        std::string raw = assignment.substr(eq + 1);

        json value = json::parse(raw, nullptr, false);
        if (value.is_discarded()) {
            value = raw;
        }
        return set(key, value);
    }

    /**
     * @return The value at key, or fallback when it is missing or has
     *         another type
     */
    template<typename T>
    T get(const std::string& key, const T& fallback = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        const json* node = find(key);
        if (!node) return fallback;

        try {
            return node->get<T>();
        } catch (const json::type_error&) {
            return fallback;
        }
    }

    template<typename T>
    bool set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            m_values[pointer(key)] = value;
            return true;
        } catch (const json::exception&) {
            return false;
        }
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return find(key) != nullptr;
    }

    /**
     * @return false if the key did not exist
     */
    bool remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto dot = key.rfind('.');
        json* parent = dot == std::string::npos ? &m_values : findMutable(key.substr(0, dot));
        if (!parent || !parent->is_object()) return false;
        return parent->erase(dot == std::string::npos ? key : key.substr(dot + 1)) > 0;
    }

    json toJson() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_values;
    }

    std::filesystem::path path() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_path;
    }

private:
    Config() : m_values(defaults()) {}
    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static json::json_pointer pointer(const std::string& key) {
        std::string text = "/" + key;
        std::replace(text.begin(), text.end(), '.', '/');
        return json::json_pointer(text);
    }

    const json* find(const std::string& key) const {
        const json* node = &m_values;
        size_t start = 0;
        while (start <= key.size()) {
            auto end = key.find('.', start);
            if (end == std::string::npos) end = key.size();

            if (!node->is_object()) return nullptr;
            auto it = node->find(key.substr(start, end - start));
            if (it == node->end()) return nullptr;

            node = &*it;
            start = end + 1;
        }
        return node;
    }

    json* findMutable(const std::string& key) {
        return const_cast<json*>(static_cast<const Config*>(this)->find(key));
    }

    mutable std::mutex m_mutex;
    json m_values;
    std::filesystem::path m_path;
};

} // namespace hauler::core
