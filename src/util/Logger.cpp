#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace hashflow {

static LogLevel parseEnvLogLevel() {
    const char* env = std::getenv("HASHFLOW_LOG");
    if (!env) return LogLevel::Info;
    std::string v(env);
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return LogLevel::Info;
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(parseEnvLogLevel()) {}

void Logger::setLevel(LogLevel level) {
    std::scoped_lock lock(mtx);
    currentLevel = level;
}

LogLevel Logger::level() const {
    std::scoped_lock lock(mtx);
    return currentLevel;
}

bool Logger::enabled(LogLevel level) const { return this->level() >= level; }

void Logger::write(LogLevel level, const char* tag, const std::string& msg) const {
    std::scoped_lock lock(mtx);
    if (currentLevel < level) return;
    // stdout carries the digest lines, so every level goes to stderr
    std::cerr << tag << msg << "\n";
}

void Logger::error(const std::string& msg) const { write(LogLevel::Error, "[error] ", msg); }
void Logger::warn(const std::string& msg) const { write(LogLevel::Warn, "[warn ] ", msg); }
void Logger::info(const std::string& msg) const { write(LogLevel::Info, "[info ] ", msg); }
void Logger::debug(const std::string& msg) const { write(LogLevel::Debug, "[debug] ", msg); }

}
