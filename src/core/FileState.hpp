#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>

namespace hashflow {

/// Registered, no bytes processed yet
struct Pending {};

/// Hashing underway; percent in [0, 100], never decreasing for one task
struct InProgress {
    float percent{0.0f};
};

/// Terminal: lowercase hex SHA-256 of the whole file
struct Completed {
    std::string digest;
};

inline bool operator==(const Pending&, const Pending&) { return true; }
inline bool operator==(const InProgress& a, const InProgress& b) { return a.percent == b.percent; }
inline bool operator==(const Completed& a, const Completed& b) { return a.digest == b.digest; }

/**
 * @brief Lifecycle of one file: Pending -> InProgress -> Completed
 *
 * There is no failed member. A task that fails simply stops
 * producing events; the reason is available from HashScheduler::failure().
 */
using FileState = std::variant<Pending, InProgress, Completed>;

inline bool isPending(const FileState& s) { return std::holds_alternative<Pending>(s); }
inline bool isInProgress(const FileState& s) { return std::holds_alternative<InProgress>(s); }
inline bool isCompleted(const FileState& s) { return std::holds_alternative<Completed>(s); }

/// Percent for display: 0 while pending, 100 once completed
float percentOf(const FileState& s);

/// Digest of a completed state, empty string otherwise
const std::string& digestOf(const FileState& s);

/// Human readable form for logs ("pending", "42.0%", "completed <digest>")
std::string describe(const FileState& s);

/**
 * @brief One unit of work as tracked by the host
 *
 * identity is fixed at creation. sizeBytes is captured once, before any
 * chunk is read, and is 0 until the pipeline has opened the file.
 */
struct FileTask {
    std::filesystem::path identity;
    uint64_t sizeBytes{0};
    FileState state{Pending{}};
};

/// Element of the engine's output stream
struct FileEvent {
    std::filesystem::path identity;
    FileState state;
};

}
