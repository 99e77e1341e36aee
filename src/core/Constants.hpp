#pragma once

#include <cstddef>

/**
 * @brief Engine tuning defaults used throughout the codebase
 *
 * Centralizes magic numbers; EngineConfig starts from these and lets the
 * environment and command line override them.
 */
namespace hashflow {

namespace Constants {
    // Chunked reading
    constexpr size_t DEFAULT_CHUNK_SIZE = 1024 * 1024;       // 1 MiB read ceiling per chunk
    constexpr size_t DEFAULT_QUEUE_CAPACITY = 10;            // Chunks buffered between reader and hasher

    // Event delivery
    constexpr size_t DEFAULT_STREAM_CAPACITY = 64;           // Multiplexed event stream slots
    constexpr float DEFAULT_PROGRESS_STEP = 1.0f;            // Min percent-point gain between progress events

    // Scheduling
    constexpr size_t MAX_DEFAULT_CONCURRENCY = 8;            // Upper clamp for hardware_concurrency()
    constexpr size_t MAX_JOBS = 64;                          // Upper bound for --jobs / HASHFLOW_JOBS

    // Digest
    constexpr size_t SHA256_HEX_LENGTH = 64;                 // SHA-256 produces 64-char hex strings
    constexpr const char* EMPTY_SHA256 =
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

    constexpr const char* APP_NAME = "hashflow";
}
}
