#pragma once

/**
 * Logger.hpp
 *
 * Centralized logging for the download engine and the CLI.
 * Uses spdlog as the underlying logging library.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <vector>
#include <filesystem>

namespace docfetch::core {

/**
 * Log level enumeration
 */
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
 * Logger class - Thread-safe singleton logger
 *
 * Output sinks:
 * - stderr with colors (stdout is reserved for command output)
 * - Rotating file output, only when a log directory is given
 *
 * Nothing is logged before initialize() is called.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * Initialize the logger
     * @param level Minimum log level
     * @param logDir Log file directory (empty = console only)
     */
    void initialize(LogLevel level = LogLevel::Info,
                   const std::string& logDir = "") {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_level(toSpdlogLevel(level));
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (!logDir.empty()) {
                std::filesystem::path logPath = std::filesystem::path(logDir) / "docfetch.log";
                std::filesystem::create_directories(logPath.parent_path());

                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logPath.string(),
                    1024 * 1024 * 10, // 10 MB
                    5,                // 5 rotated files
                    false
                );
                fileSink->set_level(spdlog::level::trace);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(fileSink);
            }

            m_logger = std::make_shared<spdlog::logger>("docfetch", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(level));
            m_logger->flush_on(spdlog::level::warn);

            spdlog::set_default_logger(m_logger);

        } catch (const spdlog::spdlog_ex& ex) {
            m_logger = spdlog::stderr_color_mt("docfetch_fallback");
            m_logger->error("Logger initialization failed: {}", ex.what());
        } catch (const std::filesystem::filesystem_error& ex) {
            m_logger = spdlog::stderr_color_mt("docfetch_fallback");
            m_logger->error("Cannot create log directory: {}", ex.what());
        }
    }

    void setLevel(LogLevel level) {
        if (m_logger) {
            m_logger->set_level(toSpdlogLevel(level));
        }
    }

    void flush() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    /**
     * Parse a level name ("debug", "WARN", ...)
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

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (m_logger) {
            m_logger->critical(fmt, std::forward<Args>(args)...);
        }
    }

private:
    Logger() = default;
    ~Logger() {
        if (m_logger) {
            m_logger->flush();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
            default:                 return spdlog::level::info;
        }
    }

private:
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace docfetch::core
