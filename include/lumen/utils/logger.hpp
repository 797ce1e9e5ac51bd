/**
 * @file logger.hpp
 * @brief Thread-safe native logging framework for Lumen.
 *
 * Zero external dependencies. Lines carry a timestamp, a level column and
 * a component tag, and go to stderr or to a sink installed by the host
 * application.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace lumen {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Fixed-width level column ("INFO ", "WARN ", ...).
 */
inline const char* logLevelToString(LogLevel level) {
    static const char* const kColumns[] = {
        "TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL", "OFF  "
    };
    int index = static_cast<int>(level);
    return (index >= 0 && index <= 6) ? kColumns[index] : "?????";
}

/**
 * @brief Receives every formatted log line that passes the level filter.
 *
 * The line has no trailing newline and no color codes.
 */
using LogSink = std::function<void(LogLevel level, const std::string& line)>;

/**
 * @class Logger
 * @brief Thread-safe singleton logger.
 *
 * FATAL is only a severity; the logger never ends the host process.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Discovery", "Found device {} at {}", mac, ip);
 * @endcode
 */
class LUMEN_UTILS_API Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * @brief Name of a level without padding ("INFO", "WARN", ...).
     */
    static std::string levelName(LogLevel level) {
        std::string name = logLevelToString(level);
        name.erase(name.find_last_not_of(' ') + 1);
        return name;
    }

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable ANSI colors on stderr. Sinks never see colors.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Route log lines to @p sink instead of stderr.
     * An empty function restores stderr output.
     */
    void setSink(LogSink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    /**
     * @brief Log a message; each "{}" in @p format takes the next argument.
     */
    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::vector<std::string> values{toText(std::forward<Args>(args))...};
        std::string prefix = timestamp();
        std::string rest = std::string(" [") + component + "] " + substitute(format, values);

        std::lock_guard<std::mutex> lock(mutex_);
        if (sink_) {
            sink_(level, prefix + "[" + logLevelToString(level) + "]" + rest);
            return;
        }
        if (colorEnabled_.load(std::memory_order_relaxed)) {
            std::cerr << prefix << colorFor(level) << "[" << logLevelToString(level) << "]"
                      << "\033[0m" << rest << std::endl;
        } else {
            std::cerr << prefix << "[" << logLevelToString(level) << "]" << rest << std::endl;
        }
    }

private:
    Logger() : level_(static_cast<int>(LogLevel::INFO)), colorEnabled_(true) {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename T>
    static std::string toText(T&& value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

    // Placeholders without a value are kept verbatim; surplus values are dropped
    static std::string substitute(const char* format, const std::vector<std::string>& values) {
        std::string out;
        size_t next = 0;
        for (const char* p = format; *p; ++p) {
            if (p[0] == '{' && p[1] == '}' && next < values.size()) {
                out += values[next++];
                ++p;
            } else {
                out += *p;
            }
        }
        return out;
    }

    // "[YYYY-MM-DD HH:MM:SS.mmm] "
    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &seconds);
#else
        localtime_r(&seconds, &local);
#endif

        std::ostringstream oss;
        oss << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << millis << "] ";
        return oss.str();
    }

    static const char* colorFor(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "\033[90m";
            case LogLevel::DEBUG: return "\033[36m";
            case LogLevel::INFO:  return "\033[32m";
            case LogLevel::WARN:  return "\033[33m";
            case LogLevel::ERROR: return "\033[31m";
            case LogLevel::FATAL: return "\033[35;1m";
            default:              return "";
        }
    }

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    LogSink sink_;
};

}  // namespace utils
}  // namespace lumen

// =============================================================================
// Convenience Macros
// =============================================================================

#define LUMEN_LOG(level, component, ...) \
    ::lumen::utils::Logger::instance().log(level, component, __VA_ARGS__)

#define LOG_TRACE(component, ...) LUMEN_LOG(::lumen::utils::LogLevel::TRACE, component, __VA_ARGS__)
#define LOG_DEBUG(component, ...) LUMEN_LOG(::lumen::utils::LogLevel::DEBUG, component, __VA_ARGS__)
#define LOG_INFO(component, ...)  LUMEN_LOG(::lumen::utils::LogLevel::INFO, component, __VA_ARGS__)
#define LOG_WARN(component, ...)  LUMEN_LOG(::lumen::utils::LogLevel::WARN, component, __VA_ARGS__)
#define LOG_ERROR(component, ...) LUMEN_LOG(::lumen::utils::LogLevel::ERROR, component, __VA_ARGS__)
#define LOG_FATAL(component, ...) LUMEN_LOG(::lumen::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Arguments are not evaluated when the condition is false or the level is off
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::lumen::utils::Logger::instance().isEnabled(level)) { \
            LUMEN_LOG(level, component, __VA_ARGS__); \
        } \
    } while (0)
