#pragma once

#include <mutex>
#include <string>

namespace hashflow {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide leveled logger
 *
 * Level comes from HASHFLOW_LOG ("debug", "info", "warn", "error" or 3..0)
 * and defaults to info. Every level is written to stderr. Safe to call from
 * pipeline worker threads.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

private:
    Logger();
    void write(LogLevel level, const char* tag, const std::string& msg) const;

    LogLevel currentLevel;
    mutable std::mutex mtx;  // One line at a time across threads
};

}
