#pragma once

#include <cstddef>
#include <filesystem>

#include "core/Constants.hpp"
#include "core/EventSink.hpp"
#include "util/CancellationToken.hpp"
#include "util/Expected.hpp"

namespace hashflow {

struct PipelineOptions {
    size_t chunkSize{Constants::DEFAULT_CHUNK_SIZE};
    size_t queueCapacity{Constants::DEFAULT_QUEUE_CAPACITY};
    float progressStep{Constants::DEFAULT_PROGRESS_STEP};
};

/**
 * @brief Hashes one file and reports its progress to a sink
 *
 * Two stages joined by a bounded hand-off queue:
 *   reader stage  - own thread, ChunkReader -> queue
 *   hashing stage - the thread calling run(), queue -> digest + progress
 * Memory is capped at roughly (queueCapacity + 2) * chunkSize.
 *
 * Events, in order:
 *   InProgress{0}         right after the file is opened (non-empty files)
 *   InProgress{p}...      throttled by ProgressTracker
 *   Completed{digest}     exactly once, on success
 * An empty file produces only Completed.
 *
 * The token is checked between chunks and before every send; a cancelled
 * token or a sink that reports no receiver stops the pipeline with
 * Disconnected. Open/metadata/read errors stop it with the matching code.
 * Either way nothing more is sent and the reader stage is joined before
 * run() returns. A read already in progress is not interrupted.
 */
class FilePipeline {
public:
    FilePipeline(std::filesystem::path identity, EventSink& sink, CancellationToken token,
                 PipelineOptions options = {});

    Expected<void> run();

    const std::filesystem::path& identity() const { return path; }

private:
    bool deliver(const FileState& state);

    std::filesystem::path path;
    EventSink& sink;
    CancellationToken token;
    PipelineOptions options;
};

}
