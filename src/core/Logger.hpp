#pragma once

/**
 * Logger.hpp
 *
 * Process-wide logger on top of spdlog. Writes colored lines to the console
 * and, when a directory is configured, to a size-rotated hauler.log.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace hauler::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Sink setup, filled from the "logging" section of the configuration
 */
struct LogOptions {
    LogLevel level{LogLevel::Info};
    std::filesystem::path directory;   // empty: no log file
    size_t maxFileSize{10 * 1024 * 1024};
    size_t maxFiles{5};
    bool console{true};
};

/**
 * Logger - singleton wrapper around one spdlog logger
 *
 * Messages logged before initialize() are dropped. initialize() may be
 * called again to rebuild the sinks.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Build the sinks
     * @return false if the log file could not be opened; console logging
     *         still works in that case
     */
    bool initialize(const LogOptions& options) {
        std::vector<spdlog::sink_ptr> sinks;
        bool fileOk = true;

        if (options.console) {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(console);
        }

        if (!options.directory.empty()) {
            try {
                std::filesystem::create_directories(options.directory);
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    (options.directory / "hauler.log").string(),
                    std::max<size_t>(options.maxFileSize, 1024),
                    std::max<size_t>(options.maxFiles, 1));
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(file);
            } catch (const spdlog::spdlog_ex& e) {
                fileOk = false;
                m_fileError = e.what();
            } catch (const std::filesystem::filesystem_error& e) {
                fileOk = false;
                m_fileError = e.what();
            }
        }

        auto logger = std::make_shared<spdlog::logger>("hauler", sinks.begin(), sinks.end());
        logger->set_level(toSpdlog(options.level));
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(3));
        m_logger = std::move(logger);

        if (!fileOk) {
            m_logger->warn("Log file disabled: {}", m_fileError);
        }
        return fileOk;
    }

    bool isInitialized() const { return m_logger != nullptr; }

    void setLevel(LogLevel level) {
        if (m_logger) m_logger->set_level(toSpdlog(level));
    }

    void flush() {
        if (m_logger) m_logger->flush();
    }

    template<typename... Args>
    void log(LogLevel level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->log(toSpdlog(level), fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log(LogLevel::Critical, fmt, std::forward<Args>(args)...);
    }

    /**
     * Parse a level name as written in the config file ("debug", "warn", ...)
     * @param name Level name, case-insensitive
     * @param fallback Level returned for unknown names
     */
    static LogLevel parseLevel(std::string name, LogLevel fallback = LogLevel::Info) {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "info") return LogLevel::Info;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off") return LogLevel::Off;
        return fallback;
    }

private:
    Logger() = default;
    ~Logger() {
        flush();
        spdlog::shutdown();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::level::level_enum toSpdlog(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
        }
        return spdlog::level::info;
    }

    std::shared_ptr<spdlog::logger> m_logger;
    std::string m_fileError;
};

} // namespace hauler::core

#define LOG_TRACE(...)    hauler::core::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...)    hauler::core::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)     hauler::core::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)     hauler::core::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...)    hauler::core::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) hauler::core::Logger::instance().critical(__VA_ARGS__)
