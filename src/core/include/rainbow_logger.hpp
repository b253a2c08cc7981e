#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <ctime>

namespace rainbow {

/**
 * @brief Logging levels for the engine
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    NONE  = 6
};

/**
 * @brief Thread-safe logger shared by codecs, facade and CLI
 *
 * Console and file sinks, a minimum level, timestamped lines:
 *   2026-01-01 12:00:00.042 [DEBUG] dispatch: untagged packet sniffed as svg_path
 * ERROR and above go to stderr.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mtx_);
        level_ = level;
    }

    void setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx_);
        console_enabled_ = enabled;
    }

    bool setFileOutput(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) file_.close();
        file_enabled_ = false;
        if (path.empty()) return false;
        file_.open(path, std::ios::app);
        file_enabled_ = file_.is_open();
        return file_enabled_;
    }

    void log(LogLevel level, const std::string& component, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (level < level_) return;

        std::string formatted = formatMessage(level, component, msg);

        if (console_enabled_) {
            if (level >= LogLevel::ERROR) {
                std::cerr << formatted << std::endl;
            } else {
                std::cout << formatted << std::endl;
            }
        }

        if (file_enabled_ && file_.is_open()) {
            file_ << formatted << std::endl;
            file_.flush();
        }
    }

    static LogLevel levelFromString(const std::string& s) {
        if (s == "trace") return LogLevel::TRACE;
        if (s == "debug") return LogLevel::DEBUG;
        if (s == "info")  return LogLevel::INFO;
        if (s == "warn" || s == "warning") return LogLevel::WARN;
        if (s == "error") return LogLevel::ERROR;
        if (s == "fatal") return LogLevel::FATAL;
        if (s == "none" || s == "off") return LogLevel::NONE;
        return LogLevel::INFO;
    }

private:
    Logger()
        : level_(LogLevel::WARN)
        , console_enabled_(true)
        , file_enabled_(false)
    {}

    ~Logger() {
        if (file_.is_open()) file_.close();
    }

    static std::string formatMessage(LogLevel level, const std::string& component,
                                     const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << " [" << levelToString(level) << "] ";
        if (!component.empty()) oss << component << ": ";
        oss << msg;
        return oss.str();
    }

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default:              return "?????";
        }
    }

    LogLevel level_;
    bool console_enabled_;
    bool file_enabled_;
    std::ofstream file_;
    mutable std::mutex mtx_;
};

#define RAINBOW_LOG_INFO(msg) \
    rainbow::Logger::instance().log(rainbow::LogLevel::INFO, std::string(), msg)
#define RAINBOW_LOG_WARN(msg) \
    rainbow::Logger::instance().log(rainbow::LogLevel::WARN, std::string(), msg)

// Component-tagged: codec name, "dispatch", "synth", ...
#define RAINBOW_CLOG_DEBUG(component, msg) \
    rainbow::Logger::instance().log(rainbow::LogLevel::DEBUG, component, msg)
#define RAINBOW_CLOG_TRACE(component, msg) \
    rainbow::Logger::instance().log(rainbow::LogLevel::TRACE, component, msg)

} // namespace rainbow
