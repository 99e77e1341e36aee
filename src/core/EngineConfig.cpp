#include "core/EngineConfig.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <string>

namespace hashflow {

Expected<size_t> parseByteSize(const std::string& text) {
    if (text.empty()) {
        return Error{ErrorCode::InvalidArgs, "empty size"};
    }

    size_t pos = 0;
    size_t value = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        size_t digit = static_cast<size_t>(text[pos] - '0');
        if (value > (std::numeric_limits<size_t>::max() - digit) / 10) {
            return Error{ErrorCode::InvalidArgs, "size too large: " + text};
        }
        value = value * 10 + digit;
        ++pos;
    }
    if (pos == 0) {
        return Error{ErrorCode::InvalidArgs, "invalid size: " + text};
    }

    size_t multiplier = 1;
    if (pos < text.size()) {
        char unit = static_cast<char>(std::toupper(static_cast<unsigned char>(text[pos])));
        if (unit == 'K') multiplier = 1024;
        else if (unit == 'M') multiplier = 1024 * 1024;
        else if (unit == 'G') multiplier = 1024 * 1024 * 1024;
        else return Error{ErrorCode::InvalidArgs, "invalid size suffix: " + text};
        ++pos;
        if (pos != text.size()) {
            return Error{ErrorCode::InvalidArgs, "invalid size: " + text};
        }
    }

    if (value == 0) {
        return Error{ErrorCode::InvalidArgs, "size must be positive: " + text};
    }
    if (value > std::numeric_limits<size_t>::max() / multiplier) {
        return Error{ErrorCode::InvalidArgs, "size too large: " + text};
    }
    return value * multiplier;
}

Expected<void> EngineConfig::setJobs(const std::string& text) {
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return Error{ErrorCode::InvalidArgs, "invalid job count: " + text};
        }
    }
    auto n = parseByteSize(text);
    if (!n) return Error{ErrorCode::InvalidArgs, "invalid job count: " + text};
    if (n.value() > Constants::MAX_JOBS) {
        return Error{ErrorCode::InvalidArgs, "job count must be at most " +
                     std::to_string(Constants::MAX_JOBS) + ": " + text};
    }
    jobs = n.value();
    return {};
}

Expected<void> EngineConfig::setChunkSize(const std::string& text) {
    auto n = parseByteSize(text);
    if (!n) return n.error();
    chunkSize = n.value();
    return {};
}

Expected<EngineConfig> EngineConfig::fromEnvironment() {
    EngineConfig cfg;
    if (const char* jobs = std::getenv("HASHFLOW_JOBS")) {
        auto res = cfg.setJobs(jobs);
        if (!res) return Error{res.error().code, "HASHFLOW_JOBS: " + res.error().message};
    }
    if (const char* chunk = std::getenv("HASHFLOW_CHUNK_SIZE")) {
        auto res = cfg.setChunkSize(chunk);
        if (!res) return Error{res.error().code, "HASHFLOW_CHUNK_SIZE: " + res.error().message};
    }
    return cfg;
}

SchedulerOptions EngineConfig::toSchedulerOptions() const {
    SchedulerOptions options;
    options.maxConcurrent = jobs;
    options.streamCapacity = streamCapacity;
    options.pipeline.chunkSize = chunkSize;
    options.pipeline.queueCapacity = queueCapacity;
    options.pipeline.progressStep = progressStep;
    return options;
}

}
