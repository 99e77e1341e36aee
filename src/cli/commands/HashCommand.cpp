#include "cli/commands/HashCommand.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "core/EngineConfig.hpp"
#include "core/FileTable.hpp"
#include "core/HashScheduler.hpp"
#include "util/FileMetadata.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace hashflow {

namespace {

constexpr std::chrono::milliseconds POLL_INTERVAL{100};

struct HashArgs {
    EngineConfig config;
    bool quiet{false};
    std::vector<std::string> files;
};

Expected<HashArgs> parseArgs(const std::vector<std::string>& args) {
    auto cfg = EngineConfig::fromEnvironment();
    if (!cfg) return cfg.error();

    HashArgs parsed;
    parsed.config = cfg.value();

    bool optionsDone = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (optionsDone || a.empty() || a[0] != '-' || a == "-") {
            parsed.files.push_back(a);
            continue;
        }
        if (a == "--") {
            optionsDone = true;
        } else if (a == "-q" || a == "--quiet") {
            parsed.quiet = true;
        } else if (a == "-j" || a == "--jobs" || a == "--chunk-size") {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "hash: " + a + " requires a value"};
            }
            const std::string& value = args[++i];
            auto res = a == "--chunk-size" ? parsed.config.setChunkSize(value) : parsed.config.setJobs(value);
            if (!res) return Error{ErrorCode::InvalidArgs, "hash: " + a + ": " + res.error().message};
        } else {
            return Error{ErrorCode::InvalidArgs, "hash: unknown option " + a};
        }
    }

    if (parsed.files.empty()) {
        return Error{ErrorCode::InvalidArgs, "hash: missing <file>"};
    }
    return parsed;
}

}

/**
 * @brief Execute 'hashflow hash'
 *
 * Plays the host role around the engine:
 *   1. Register every argument with the scheduler and list it in a FileTable
 *   2. Drain the event stream into the table, printing the aggregate
 *      progress whenever its rounded value changes
 *   3. Print digests in argument order once every pipeline has stopped
 */
Expected<void> HashCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsedRes = parseArgs(args);
    if (!parsedRes) return parsedRes.error();
    const HashArgs& parsed = parsedRes.value();

    auto& log = Logger::instance();
    std::unique_ptr<HashScheduler> engine;
    try {
        engine = std::make_unique<HashScheduler>(parsed.config.toSchedulerOptions());
    } catch (const std::system_error& e) {
        return Error{ErrorCode::InternalError, std::string("cannot start workers: ") + e.what()};
    }
    HashScheduler& scheduler = *engine;
    FileTable table;
    std::map<fs::path, std::string> displayNames;  // identity -> path as typed
    size_t skipped = 0;

    for (const auto& file : parsed.files) {
        auto started = scheduler.begin(file);
        if (!started) {
            *ctx.err << "hashflow: skipping " << file << ": " << started.error().message << "\n";
            ++skipped;
            continue;
        }
        fs::path identity = HashScheduler::identityOf(file);
        if (!table.add(identity)) continue;  // Same file named twice
        displayNames.emplace(identity, file);
        if (auto meta = getFileMetadata(identity)) {
            table.setSize(identity, meta.value().sizeBytes);
        }
    }

    std::string lastTitle;
    auto render = [&] {
        if (parsed.quiet) return;
        std::string title = formatTitle(table.entries());
        if (title != lastTitle) {
            *ctx.err << title << "\n";
            lastTitle = title;
        }
    };

    while (!table.empty() && !table.allCompleted()) {
        if (scheduler.activeCount() == 0) {
            // Every pipeline has stopped; whatever they sent is already queued
            while (auto ev = scheduler.nextEvent(std::chrono::milliseconds(0))) {
                table.apply(*ev);
            }
            break;
        }
        if (auto ev = scheduler.nextEvent(POLL_INTERVAL)) {
            table.apply(*ev);
            render();
        }
    }

    size_t failed = 0;
    std::optional<Error> firstFailure;
    const auto& entries = table.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
        const FileTask& task = entries[i];
        const std::string& shown = displayNames[task.identity];
        if (!isCompleted(task.state)) {
            auto err = scheduler.failure(task.identity);
            std::string reason = err ? err->message : "stopped at " + describe(task.state);
            *ctx.err << "hashflow: " << shown << ": " << reason << "\n";
            if (!firstFailure) firstFailure = err ? *err : Error{ErrorCode::InternalError, reason};
            ++failed;
            continue;
        }
        *ctx.out << digestOf(task.state) << "  " << shown;
        if (compareWithFirst(entries, i) == DigestMatch::Mismatch) {
            *ctx.out << "  (differs from first)";
        }
        *ctx.out << "\n";
    }
    scheduler.close();

    uint64_t totalBytes = 0;
    for (const auto& task : entries) totalBytes += task.sizeBytes;
    log.debug("hashed " + std::to_string(entries.size() - failed) + " of " + std::to_string(entries.size()) +
              " files, " + std::to_string(totalBytes) + " bytes");

    if (failed > 0) {
        return Error{firstFailure->code, std::to_string(failed) + " file(s) could not be hashed"};
    }
    if (skipped > 0) {
        return Error{ErrorCode::InvalidArgs, std::to_string(skipped) + " argument(s) skipped"};
    }
    return {};
}

}
