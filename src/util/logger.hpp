#ifndef PIIMASK_UTIL_LOGGER_HPP
#define PIIMASK_UTIL_LOGGER_HPP

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <mutex>
#include <memory>
#include <functional>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <cctype>
#include <stdexcept>

/**
 * @file logger.hpp
 * @brief A thread-safe logging utility for piimask.
 *
 * Console output goes to stderr: the command-line tool writes masked and
 * unmasked documents to stdout, and diagnostics must never be mixed into them.
 *
 * Usage:
 *   - Logger::getInstance().info("Info message");
 *   - logger::warn("UNKNOWN key: FOO");
 *   - logger::enableFileOutput("piimask.log");
 *   - logger::setSink([](LogLevel lvl, const std::string &msg) { ... });
 */

namespace piimask {
namespace util {
namespace logger {

/**
 * @brief Enumeration of log levels.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/// Callback receiving every record that passes the level filter.
using LogSink = std::function<void(LogLevel, const std::string &)>;

/**
 * @brief Parse a level name ("debug", "INFO", "warn", ...). Case-insensitive.
 * @throw std::runtime_error on an unrecognized name.
 */
inline LogLevel parseLogLevel(const std::string &name)
{
    std::string upper;
    upper.reserve(name.size());
    for (unsigned char c : name) {
        upper.push_back(static_cast<char>(std::toupper(c)));
    }

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;

    throw std::runtime_error("Logger: unknown log level '" + name + "'");
}

/**
 * @brief A singleton logger class that supports:
 *  - Thread-safe logging
 *  - Various log levels
 *  - Optional file output
 *  - An optional sink that observes records (used by tests and by the CLI summary)
 */
class Logger {
public:
    /**
     * @brief Get the global Logger instance.
     */
    static Logger& getInstance()
    {
        static Logger instance;
        return instance;
    }

    /**
     * @brief Set the minimal log level. Messages below this level are discarded.
     */
    void setLogLevel(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Enable output to a file.
     * @param filename The file path to write logs into.
     * @param append If true, appends to existing file; otherwise overwrites.
     */
    void enableFileOutput(const std::string &filename, bool append = false)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
        }
        fileStream_ = std::make_unique<std::ofstream>(filename,
            append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc));
        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[Logger] Failed to open log file: " << filename << std::endl;
        }
    }

    void disableFileOutput()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    /**
     * @brief Install a sink that receives each record after level filtering.
     *        Pass an empty function to remove it.
     */
    void setSink(LogSink sink)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    /**
     * @brief Silence or restore console output. File output and the sink are unaffected.
     */
    void setConsoleOutput(bool enabled)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleEnabled_ = enabled;
    }

    void debug(const std::string &msg)
    {
        log(LogLevel::DEBUG, "DEBUG", msg);
    }

    void info(const std::string &msg)
    {
        log(LogLevel::INFO, "INFO", msg);
    }

    void warn(const std::string &msg)
    {
        log(LogLevel::WARN, "WARN", msg);
    }

    void error(const std::string &msg)
    {
        log(LogLevel::ERROR, "ERROR", msg);
    }

    void critical(const std::string &msg)
    {
        log(LogLevel::CRITICAL, "CRITICAL", msg);
    }

private:
    Logger()
        : logLevel_(LogLevel::INFO),
          consoleEnabled_(true)
    {
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string &levelName, const std::string &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) {
            return;
        }

        if (sink_) {
            sink_(level, msg);
        }

        if (!consoleEnabled_ && !fileStream_) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif
        std::ostringstream timestamp;
        timestamp << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");

        std::ostringstream line;
        line << "[" << timestamp.str() << "][" << levelName << "] " << msg << std::endl;

        if (consoleEnabled_) {
            std::cerr << line.str();
            std::cerr.flush();
        }

        if (fileStream_) {
            (*fileStream_) << line.str();
            fileStream_->flush();
        }
    }

    mutable std::mutex mutex_;
    LogLevel logLevel_;
    bool consoleEnabled_;
    LogSink sink_;
    std::unique_ptr<std::ofstream> fileStream_;
};

// ----------------------------------------------------------------------------
//  Convenience free functions (shortcuts)
// ----------------------------------------------------------------------------
inline void setLogLevel(LogLevel level)
{
    Logger::getInstance().setLogLevel(level);
}

inline void enableFileOutput(const std::string &filename, bool append = false)
{
    Logger::getInstance().enableFileOutput(filename, append);
}

inline void disableFileOutput()
{
    Logger::getInstance().disableFileOutput();
}

inline void setSink(LogSink sink)
{
    Logger::getInstance().setSink(std::move(sink));
}

inline void debug(const std::string &msg)
{
    Logger::getInstance().debug(msg);
}

inline void info(const std::string &msg)
{
    Logger::getInstance().info(msg);
}

inline void warn(const std::string &msg)
{
    Logger::getInstance().warn(msg);
}

inline void error(const std::string &msg)
{
    Logger::getInstance().error(msg);
}

inline void critical(const std::string &msg)
{
    Logger::getInstance().critical(msg);
}

} // namespace logger
} // namespace util
} // namespace piimask

#endif // PIIMASK_UTIL_LOGGER_HPP
