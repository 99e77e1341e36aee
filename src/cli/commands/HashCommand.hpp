#pragma once

#include "cli/ICommand.hpp"

namespace hashflow {

class HashCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "hash"; }
    const char* description() const override { return "Compute SHA-256 digests of files"; }
    const char* helpNameLine() const override { return "hash -  Compute SHA-256 digests of one or more files concurrently"; }
    const char* helpSynopsis() const override { return "hashflow hash [--jobs <n>] [--chunk-size <bytes>] [--quiet] [--] <file> [<file> ...]"; }
    const char* helpDescription() const override {
        return "Hash every given regular file, several at a time, showing overall progress on stderr. "
               "Prints one '<digest>  <file>' line per file in the order given. Digests that differ "
               "from the first file's are marked. Exits non-zero if any file could not be hashed.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"-j, --jobs <n>", "Files hashed at the same time, 1 to 64 (default: CPU count, at most 8; env HASHFLOW_JOBS)"},
            {"--chunk-size <bytes>", "Read size per chunk, K/M/G suffixes allowed (default: 1M; env HASHFLOW_CHUNK_SIZE)"},
            {"-q, --quiet", "Do not print progress"},
            {"<file>", "Regular file to hash. Directories are skipped with a warning."}
        };
    }
};

}
