#pragma once

#include <cstddef>
#include <string>

#include "core/HashScheduler.hpp"
#include "util/Expected.hpp"

namespace hashflow {

/**
 * @brief Engine tunables
 *
 * Resolution order: Constants defaults, then environment
 * (HASHFLOW_JOBS, HASHFLOW_CHUNK_SIZE), then command-line flags applied
 * by the caller through the setters below.
 */
struct EngineConfig {
    size_t jobs{defaultConcurrency()};
    size_t chunkSize{Constants::DEFAULT_CHUNK_SIZE};
    size_t queueCapacity{Constants::DEFAULT_QUEUE_CAPACITY};
    size_t streamCapacity{Constants::DEFAULT_STREAM_CAPACITY};
    float progressStep{Constants::DEFAULT_PROGRESS_STEP};

    /// Defaults overridden by HASHFLOW_* environment variables
    static Expected<EngineConfig> fromEnvironment();

    /// Parse and set the number of concurrent pipelines ("4"), 1..Constants::MAX_JOBS
    Expected<void> setJobs(const std::string& text);

    /// Parse and set the chunk ceiling ("65536", "64K", "1M")
    Expected<void> setChunkSize(const std::string& text);

    SchedulerOptions toSchedulerOptions() const;
};

/**
 * @brief Parse a positive byte count with optional K/M/G (binary) suffix
 * @return Value in bytes, or InvalidArgs for empty, zero, negative,
 *         malformed or overflowing input
 */
Expected<size_t> parseByteSize(const std::string& text);

}
