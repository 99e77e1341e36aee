#include "core/FilePipeline.hpp"

#include <exception>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "core/ChunkReader.hpp"
#include "core/DigestAccumulator.hpp"
#include "core/ProgressTracker.hpp"
#include "util/BoundedQueue.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace hashflow {

namespace {

Error disconnected(const fs::path& path) {
    return Error{ErrorCode::Disconnected, "No receiver for " + path.string()};
}

/// Closes the hand-off and joins the reader stage on every exit path
class ReaderStage {
public:
    ReaderStage(BoundedQueue<Chunk>& handoff, std::thread worker)
        : handoff(handoff), worker(std::move(worker)) {}
    ~ReaderStage() { stop(); }

    ReaderStage(const ReaderStage&) = delete;
    ReaderStage& operator=(const ReaderStage&) = delete;

    void stop() {
        handoff.close();
        if (worker.joinable()) worker.join();
    }

private:
    BoundedQueue<Chunk>& handoff;
    std::thread worker;
};

}

FilePipeline::FilePipeline(fs::path identity, EventSink& sink, CancellationToken token,
                           PipelineOptions options)
    : path(std::move(identity)), sink(sink), token(std::move(token)), options(options) {}

bool FilePipeline::deliver(const FileState& state) {
    if (token.isCancelled()) return false;
    return sink.send(state);
}

Expected<void> FilePipeline::run() {
    auto& log = Logger::instance();

    if (token.isCancelled()) return disconnected(path);

    auto opened = ChunkReader::open(path, options.chunkSize);
    if (!opened) return opened.error();
    ChunkReader reader = std::move(opened.value());

    const uint64_t size = reader.size();
    log.debug("hash start: " + path.string() + " (" + std::to_string(size) + " bytes)");

    ProgressTracker tracker(size, options.progressStep);
    DigestAccumulator digest;

    if (tracker.isEmpty()) {
        // Still confirm the file is really empty before reporting
        auto end = reader.next();
        if (!end) return end.error();
        if (!deliver(Completed{std::move(digest).finalize()})) return disconnected(path);
        log.debug("hash finish: " + path.string());
        return {};
    }

    if (!deliver(InProgress{0.0f})) return disconnected(path);

    BoundedQueue<Chunk> handoff(options.queueCapacity);
    std::optional<Error> readError;  // Written by the reader stage, read after join

    ReaderStage stage(handoff, std::thread([&] {
        try {
            while (!token.isCancelled()) {
                auto next = reader.next();
                if (!next) {
                    readError = next.error();
                    break;
                }
                if (!next.value()) break;
                if (!handoff.push(std::move(*next.value()))) break;  // Hashing stage gone
            }
        } catch (const std::exception& e) {
            readError = Error{ErrorCode::InternalError, std::string("reader stage: ") + e.what()};
        }
        handoff.close();
    }));

    Expected<void> result;
    while (auto chunk = handoff.pop()) {
        if (token.isCancelled()) {
            result = disconnected(path);
            break;
        }
        digest.update(*chunk);
        if (auto pct = tracker.advance(chunk->size())) {
            if (!deliver(InProgress{*pct})) {
                result = disconnected(path);
                break;
            }
        }
    }
    stage.stop();

    if (!result) {
        log.debug("hash cancelled: " + path.string());
        return result;
    }
    if (readError) return *readError;
    if (token.isCancelled()) {
        log.debug("hash cancelled: " + path.string());
        return disconnected(path);
    }
    if (tracker.bytesProcessed() != size) {
        return Error{ErrorCode::InternalError,
                     "Hashed " + std::to_string(tracker.bytesProcessed()) + " of " +
                     std::to_string(size) + " bytes: " + path.string()};
    }

    if (!deliver(Completed{std::move(digest).finalize()})) return disconnected(path);
    log.debug("hash finish: " + path.string());
    return {};
}

}
