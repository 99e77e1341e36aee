#include "core/HashScheduler.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <thread>
#include <utility>

#include "util/FileMetadata.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace hashflow {

size_t defaultConcurrency() {
    size_t hw = std::thread::hardware_concurrency();
    return std::clamp<size_t>(hw, 1, Constants::MAX_DEFAULT_CONCURRENCY);
}

/// Tags a pipeline's states with its identity and pushes them into the stream
class HashScheduler::StreamSink : public EventSink {
public:
    StreamSink(HashScheduler& owner, fs::path identity, uint64_t generation, CancellationToken token)
        : owner(owner), identity(std::move(identity)), generation(generation), token(std::move(token)) {}

    bool send(const FileState& state) override {
        // Flag first so a host that has seen Completed also sees isCompleted()
        bool terminal = hashflow::isCompleted(state);
        if (terminal) owner.setCompleted(identity, generation, true);
        Envelope env{FileEvent{identity, state}, generation};
        bool delivered = owner.stream.push(std::move(env), [this] { return token.isCancelled(); });
        if (!delivered && terminal) owner.setCompleted(identity, generation, false);
        return delivered;
    }

private:
    HashScheduler& owner;
    fs::path identity;
    uint64_t generation;
    CancellationToken token;
};

HashScheduler::HashScheduler(SchedulerOptions options)
    : opts(std::move(options)),
      stream(opts.streamCapacity),
      pool(opts.maxConcurrent) {
    Logger::instance().debug("scheduler: " + std::to_string(pool.workerCount()) + " lanes, stream capacity " +
                             std::to_string(stream.capacity()));
}

HashScheduler::~HashScheduler() {
    close();
}

fs::path HashScheduler::identityOf(const fs::path& file) {
    return resolveIdentity(file);
}

Expected<bool> HashScheduler::begin(const fs::path& file) {
    auto meta = getFileMetadata(file);
    if (!meta || !meta.value().regularFile) {
        return Error{ErrorCode::InvalidArgs, "Not a regular file: " + file.string()};
    }
    fs::path identity = identityOf(file);

    std::scoped_lock lock(mtx);
    if (closed) {
        return Error{ErrorCode::Disconnected, "Scheduler is closed"};
    }
    if (slots.count(identity)) {
        Logger::instance().debug("already tracked: " + identity.string());
        return false;
    }

    Slot slot;
    slot.generation = ++nextGeneration;
    CancellationToken token = slot.token;
    uint64_t generation = slot.generation;
    slots.emplace(identity, std::move(slot));

    bool queued = pool.submit([this, identity, token, generation] {
        runPipeline(identity, token, generation);
    });
    if (!queued) {
        slots.erase(identity);
        return Error{ErrorCode::Disconnected, "Scheduler is shutting down"};
    }
    Logger::instance().debug("tracking: " + identity.string());
    return true;
}

void HashScheduler::remove(const fs::path& file) {
    fs::path identity = identityOf(file);
    std::scoped_lock lock(mtx);
    auto it = slots.find(identity);
    if (it == slots.end()) return;
    it->second.token.cancel();
    slots.erase(it);
    Logger::instance().debug("untracked: " + identity.string());
}

void HashScheduler::cancelAll() {
    std::scoped_lock lock(mtx);
    for (auto& kv : slots) {
        kv.second.token.cancel();
    }
    slots.clear();
}

std::optional<FileEvent> HashScheduler::nextEvent(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto now = std::chrono::steady_clock::now();
        auto left = deadline > now
            ? std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
            : std::chrono::milliseconds(0);

        auto env = stream.popFor(left);
        if (!env) return std::nullopt;

        // Drop leftovers of files removed after the event was queued
        if (isCurrent(env->event.identity, env->generation)) {
            return std::move(env->event);
        }
    }
}

void HashScheduler::close() {
    {
        std::scoped_lock lock(mtx);
        if (!closed) {
            closed = true;
            for (auto& kv : slots) {
                kv.second.token.cancel();
            }
        }
    }
    stream.close();
    pool.shutdown();
}

bool HashScheduler::isTracked(const fs::path& file) const {
    fs::path identity = identityOf(file);
    std::scoped_lock lock(mtx);
    return slots.count(identity) > 0;
}

bool HashScheduler::isCompleted(const fs::path& file) const {
    fs::path identity = identityOf(file);
    std::scoped_lock lock(mtx);
    auto it = slots.find(identity);
    return it != slots.end() && it->second.completed;
}

size_t HashScheduler::activeCount() const {
    std::scoped_lock lock(mtx);
    return static_cast<size_t>(std::count_if(slots.begin(), slots.end(),
                                             [](const auto& kv) { return kv.second.running; }));
}

std::optional<Error> HashScheduler::failure(const fs::path& file) const {
    fs::path identity = identityOf(file);
    std::scoped_lock lock(mtx);
    auto it = slots.find(identity);
    if (it == slots.end()) return std::nullopt;
    return it->second.error;
}

void HashScheduler::runPipeline(const fs::path& identity, CancellationToken token, uint64_t generation) {
    StreamSink sink(*this, identity, generation, token);
    FilePipeline pipeline(identity, sink, token, opts.pipeline);
    try {
        auto result = pipeline.run();
        finishSlot(identity, generation, result);
    } catch (const std::exception& e) {
        Expected<void> failed = Error{ErrorCode::InternalError, e.what()};
        finishSlot(identity, generation, failed);
    }
}

void HashScheduler::setCompleted(const fs::path& identity, uint64_t generation, bool completed) {
    std::scoped_lock lock(mtx);
    auto it = slots.find(identity);
    if (it != slots.end() && it->second.generation == generation) {
        it->second.completed = completed;
    }
}

void HashScheduler::finishSlot(const fs::path& identity, uint64_t generation, const Expected<void>& result) {
    auto& log = Logger::instance();
    std::scoped_lock lock(mtx);
    auto it = slots.find(identity);
    bool current = it != slots.end() && it->second.generation == generation;
    if (current) it->second.running = false;

    if (result) return;

    const Error& err = result.error();
    std::string line = std::string("hash ") + errorCodeName(err.code) + ": " + err.message;
    if (err.code == ErrorCode::Disconnected || !current) {
        log.debug(line);
        return;
    }
    if (err.code == ErrorCode::InternalError) {
        log.error(line);
    } else {
        log.warn(line);
    }
    it->second.error = err;
}

bool HashScheduler::isCurrent(const fs::path& identity, uint64_t generation) const {
    std::scoped_lock lock(mtx);
    auto it = slots.find(identity);
    return it != slots.end() && it->second.generation == generation;
}

}
