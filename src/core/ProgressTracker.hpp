#pragma once

#include <cstdint>
#include <optional>

#include "core/Constants.hpp"

namespace hashflow {

/**
 * @brief Turns cumulative byte counts into throttled percent updates
 *
 * advance() reports a new percent only when it is strictly above the last
 * reported one and either at least `step` points higher or exactly 100.
 * With 1 MiB chunks on a large file this keeps the event rate at about one
 * per percentage point instead of one per chunk. A step of 0 reports every
 * strict increase.
 *
 * Percent starts out reported as 0 (the pipeline announces InProgress{0}
 * itself) and is clamped to [0, 100].
 *
 * For an empty file (totalSize == 0) advance() never reports anything;
 * the pipeline goes straight to Completed.
 */
class ProgressTracker {
public:
    explicit ProgressTracker(uint64_t totalSize, float step = Constants::DEFAULT_PROGRESS_STEP);

    /// Account for `bytes` more bytes; returns the percent to emit, if any
    std::optional<float> advance(uint64_t bytes);

    /// Percent for the bytes seen so far, regardless of throttling
    float currentPercent() const;

    float lastEmitted() const { return lastReported; }
    uint64_t bytesProcessed() const { return processed; }
    uint64_t totalSize() const { return total; }
    bool isEmpty() const { return total == 0; }

private:
    uint64_t total;
    uint64_t processed{0};
    float step;
    float lastReported{0.0f};
};

}
