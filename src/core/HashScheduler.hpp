#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>

#include "core/FilePipeline.hpp"
#include "core/FileState.hpp"
#include "util/BoundedQueue.hpp"
#include "util/CancellationToken.hpp"
#include "util/Expected.hpp"
#include "util/WorkerPool.hpp"

namespace hashflow {

/// hardware_concurrency() clamped to [1, Constants::MAX_DEFAULT_CONCURRENCY]
size_t defaultConcurrency();

struct SchedulerOptions {
    size_t maxConcurrent{defaultConcurrency()};                 // Pipelines running at once
    size_t streamCapacity{Constants::DEFAULT_STREAM_CAPACITY};  // Multiplexed event slots
    PipelineOptions pipeline{};
};

/**
 * @brief Runs one FilePipeline per tracked file and merges their events
 *
 * Each registered identity gets a slot holding its cancellation token. A
 * slot lives until remove()/cancelAll(), so registering a file again while
 * it is pending, running, failed or completed does nothing; in particular a
 * completed file is never re-hashed even if it changed on disk.
 *
 * Pipelines run on a WorkerPool of maxConcurrent lanes (each with its own
 * reader thread); extra registrations wait their turn. All events go into
 * one bounded stream read with nextEvent(). Events of one file keep their
 * order; events of different files interleave freely.
 *
 * remove() cancels the slot's token and drops any of its events still in
 * the stream. close() is the consumer going away: every pipeline stops at
 * its next check or send, and the pool is joined.
 *
 * Failures never show up in the stream. failure() reports the last error
 * of a tracked identity, and the error is logged.
 */
class HashScheduler {
public:
    explicit HashScheduler(SchedulerOptions options = {});
    ~HashScheduler();

    HashScheduler(const HashScheduler&) = delete;
    HashScheduler& operator=(const HashScheduler&) = delete;

    /// Identity used for a path in events and lookups
    static std::filesystem::path identityOf(const std::filesystem::path& file);

    /**
     * @brief Register a file for hashing
     * @return true if a pipeline was queued, false if already tracked,
     *         InvalidArgs if the path is not a regular file,
     *         Disconnected after close()
     */
    Expected<bool> begin(const std::filesystem::path& file);

    /// Stop tracking a file; its pipeline winds down on its own
    void remove(const std::filesystem::path& file);

    /// remove() for every tracked file
    void cancelAll();

    /// Next event, or nullopt on timeout / once closed and drained
    std::optional<FileEvent> nextEvent(std::chrono::milliseconds timeout);

    /// Disconnect the consumer, stop all pipelines and join the workers
    void close();

    bool isTracked(const std::filesystem::path& file) const;
    bool isCompleted(const std::filesystem::path& file) const;

    /// Pipelines queued or running
    size_t activeCount() const;

    /// Last error of a tracked file whose pipeline stopped early
    std::optional<Error> failure(const std::filesystem::path& file) const;

    const SchedulerOptions& options() const { return opts; }

private:
    class StreamSink;

    struct Slot {
        CancellationToken token;
        uint64_t generation{0};
        bool running{true};
        bool completed{false};
        std::optional<Error> error;
    };

    struct Envelope {
        FileEvent event;
        uint64_t generation{0};
    };

    void runPipeline(const std::filesystem::path& identity, CancellationToken token, uint64_t generation);
    void setCompleted(const std::filesystem::path& identity, uint64_t generation, bool completed);
    void finishSlot(const std::filesystem::path& identity, uint64_t generation, const Expected<void>& result);
    bool isCurrent(const std::filesystem::path& identity, uint64_t generation) const;

    SchedulerOptions opts;
    mutable std::mutex mtx;
    std::map<std::filesystem::path, Slot> slots;  // Guarded by mtx
    uint64_t nextGeneration{0};                   // Guarded by mtx
    bool closed{false};                           // Guarded by mtx
    BoundedQueue<Envelope> stream;
    WorkerPool pool;  // Last: destroyed (joined) before the state above
};

}
