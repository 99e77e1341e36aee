#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <vector>

#include "core/Constants.hpp"
#include "util/Expected.hpp"

namespace hashflow {

using Chunk = std::vector<uint8_t>;

/**
 * @brief One-shot, in-order chunked view of a file
 *
 * The size is taken from filesystem metadata when the reader is opened and
 * is never re-queried. next() hands out consecutive chunks of at most
 * chunkSize bytes; the last one is exactly the remainder, so the chunk
 * lengths always add up to size().
 *
 * The sequence ends with an empty optional on success or an error:
 *   OpenFailure      - file could not be opened
 *   MetadataFailure  - size could not be determined
 *   ReadFailure      - short read (file shrank / I/O error) or the file
 *                      turned out longer than its recorded size
 * No partial chunk is ever returned. Once ended, the sequence stays ended.
 *
 * Reads block; call this from a worker thread only.
 */
class ChunkReader {
public:
    ChunkReader() = default;

    ChunkReader(ChunkReader&&) = default;
    ChunkReader& operator=(ChunkReader&&) = default;
    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;

    /**
     * @brief Open a file for chunked reading
     * @param path File to read
     * @param chunkSize Read ceiling per chunk (must be > 0)
     */
    static Expected<ChunkReader> open(const std::filesystem::path& path,
                                      size_t chunkSize = Constants::DEFAULT_CHUNK_SIZE);

    /// Next chunk in file order, empty optional when exhausted
    Expected<std::optional<Chunk>> next();

    const std::filesystem::path& path() const { return filePath; }
    uint64_t size() const { return sizeBytes; }
    uint64_t remaining() const { return remainingBytes; }
    size_t chunkSize() const { return chunkBytes; }
    bool finished() const { return done; }

private:
    std::filesystem::path filePath;
    std::ifstream in;
    uint64_t sizeBytes{0};
    uint64_t remainingBytes{0};
    size_t chunkBytes{Constants::DEFAULT_CHUNK_SIZE};
    bool done{true};
};

}
