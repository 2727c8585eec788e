/**
 * GeoMesh Converter - Logging
 *
 * Tagged, level-filtered logging shared by the library and the CLI.
 * Output goes to the console, an optional log file and an optional
 * callback sink. Nothing is written to disk unless a file is configured.
 */

#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <iostream>
#include <mutex>
#include <atomic>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <filesystem>
#include <functional>
#include <optional>

namespace geomesh {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    None = 4     // Disable all logging
};

constexpr const char* log_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        default:                return "NONE";
    }
}

/**
 * Parse a level name as written in configuration files ("debug", "info",
 * "warning"/"warn", "error", "none").
 */
inline std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "none") return LogLevel::None;
    return std::nullopt;
}

class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level) {
        min_level_.store(level, std::memory_order_release);
    }

    LogLevel level() const {
        return min_level_.load(std::memory_order_acquire);
    }

    // Lock-free check used by the LOG_* macros before formatting
    bool is_enabled(LogLevel level) const {
        return level != LogLevel::None && level >= min_level_.load(std::memory_order_acquire);
    }

    void set_console_output(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        console_enabled_ = enabled;
    }

    /**
     * Append to the given file; an empty path closes the current one.
     */
    bool set_file(const std::filesystem::path& path) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (file_.is_open()) {
            file_.close();
        }
        if (path.empty()) {
            return true;
        }

        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }

        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    void set_sink(Sink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    void write(LogLevel level, std::string_view tag, std::string_view message) {
        if (!is_enabled(level)) return;

        std::string line = format_line(level, tag, message);

        std::lock_guard<std::mutex> lock(mutex_);

        if (console_enabled_) {
            auto& stream = (level >= LogLevel::Warning) ? std::cerr : std::clog;
            stream << line << '\n';
        }

        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
        }

        if (sink_) {
            sink_(level, std::string(message));
        }
    }

private:
    Logger() = default;
    ~Logger() {
        if (file_.is_open()) {
            file_.close();
        }
    }

    static std::string format_line(LogLevel level, std::string_view tag, std::string_view message) {
        std::ostringstream ss;

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
#ifdef _WIN32
        localtime_s(&tm_buf, &time);
#else
        localtime_r(&time, &tm_buf);
#endif

        ss << std::put_time(&tm_buf, "%H:%M:%S") << '.'
           << std::setfill('0') << std::setw(3) << ms.count() << ' ';
        ss << '[' << log_level_string(level) << "] ";
        if (!tag.empty()) {
            ss << '[' << tag << "] ";
        }
        ss << message;

        return ss.str();
    }

    std::mutex mutex_;
    std::atomic<LogLevel> min_level_{LogLevel::Info};
    bool console_enabled_ = true;
    std::ofstream file_;
    Sink sink_;
};

// Stream-based logging macros - usage: LOG_INFO("Tag", "message " << value)
#define GEOMESH_LOG_AT(level, tag, msg) \
    do { \
        if (geomesh::Logger::instance().is_enabled(level)) { \
            std::ostringstream _log_ss; \
            _log_ss << msg; \
            geomesh::Logger::instance().write(level, tag, _log_ss.str()); \
        } \
    } while(0)

#define LOG_DEBUG(tag, msg) GEOMESH_LOG_AT(geomesh::LogLevel::Debug, tag, msg)
#define LOG_INFO(tag, msg) GEOMESH_LOG_AT(geomesh::LogLevel::Info, tag, msg)
#define LOG_WARNING(tag, msg) GEOMESH_LOG_AT(geomesh::LogLevel::Warning, tag, msg)
#define LOG_WARN(tag, msg) LOG_WARNING(tag, msg)
#define LOG_ERROR(tag, msg) GEOMESH_LOG_AT(geomesh::LogLevel::Error, tag, msg)

} // namespace geomesh
