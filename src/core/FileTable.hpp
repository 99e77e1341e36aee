#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/FileState.hpp"

namespace hashflow {

/// Outcome of comparing a file's digest with the first file's
enum class DigestMatch { Unknown, Match, Mismatch };

/**
 * @brief Host-side list of files and their last known state
 *
 * Keeps registration order. It is the single writer of file states: the
 * host feeds every event from HashScheduler::nextEvent() through apply().
 * Events for identities that are not (or no longer) listed are ignored.
 *
 * Not thread-safe; owned and used by the thread that drains the stream.
 */
class FileTable {
public:
    /// Append as Pending unless the identity is already listed; true if added
    bool add(const std::filesystem::path& identity);

    /// Replace the state of a listed identity; false if unknown
    bool apply(const FileEvent& event);

    /// Record the byte size once the caller knows it
    bool setSize(const std::filesystem::path& identity, uint64_t sizeBytes);

    bool remove(const std::filesystem::path& identity);
    void clear() { tasks.clear(); }

    const FileTask* find(const std::filesystem::path& identity) const;
    const std::vector<FileTask>& entries() const { return tasks; }
    bool empty() const { return tasks.empty(); }
    size_t size() const { return tasks.size(); }

    /// Every listed file is Completed (false for an empty table)
    bool allCompleted() const;

private:
    std::vector<FileTask> tasks;
};

/**
 * @brief Overall progress shown while files are hashing
 *
 * Minimum percent over entries that are InProgress above 0, so the slowest
 * file that has made headway drives the figure. nullopt when there is none.
 */
std::optional<float> aggregateProgress(const std::vector<FileTask>& entries);

/// "NN% - hashflow" while aggregateProgress() has a value, "hashflow" otherwise
std::string formatTitle(const std::vector<FileTask>& entries);

/// Compare entry `index` against the first entry; Unknown until both are Completed
DigestMatch compareWithFirst(const std::vector<FileTask>& entries, size_t index);

}
