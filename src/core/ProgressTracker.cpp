#include "core/ProgressTracker.hpp"

#include <algorithm>

namespace hashflow {

ProgressTracker::ProgressTracker(uint64_t totalSize, float step)
    : total(totalSize), step(std::max(step, 0.0f)) {}

float ProgressTracker::currentPercent() const {
    if (total == 0) return 0.0f;
    double pct = static_cast<double>(processed) / static_cast<double>(total) * 100.0;
    // Rounding at the last chunk can land a hair outside the range
    return static_cast<float>(std::clamp(pct, 0.0, 100.0));
}

std::optional<float> ProgressTracker::advance(uint64_t bytes) {
    if (total == 0) return std::nullopt;

    processed += bytes;
    float pct = currentPercent();
    if (pct <= lastReported) return std::nullopt;
    if (pct < 100.0f && pct - lastReported < step) return std::nullopt;

    lastReported = pct;
    return pct;
}

}
