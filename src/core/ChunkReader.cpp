#include "core/ChunkReader.hpp"

#include <algorithm>
#include <string>

#include "util/FileMetadata.hpp"

namespace fs = std::filesystem;

namespace hashflow {

Expected<ChunkReader> ChunkReader::open(const fs::path& path, size_t chunkSize) {
    if (chunkSize == 0) {
        return Error{ErrorCode::InvalidArgs, "chunk size must be positive"};
    }

    ChunkReader reader;
    reader.filePath = path;
    reader.chunkBytes = chunkSize;

    reader.in.open(path, std::ios::binary);
    if (!reader.in) {
        return Error{ErrorCode::OpenFailure, "Failed to open file for hashing: " + path.string()};
    }

    auto meta = getFileMetadata(path);
    if (!meta) {
        return Error{ErrorCode::MetadataFailure, meta.error().message};
    }
    if (!meta.value().regularFile) {
        return Error{ErrorCode::MetadataFailure, "Not a regular file: " + path.string()};
    }

    reader.sizeBytes = meta.value().sizeBytes;
    reader.remainingBytes = reader.sizeBytes;
    reader.done = false;
    return reader;
}

Expected<std::optional<Chunk>> ChunkReader::next() {
    if (done) {
        return std::optional<Chunk>{};
    }

    if (remainingBytes == 0) {
        done = true;
        // Recorded size reached; anything beyond it means the file grew
        if (in.peek() != std::ifstream::traits_type::eof()) {
            return Error{ErrorCode::ReadFailure, "File grew while hashing: " + filePath.string()};
        }
        return std::optional<Chunk>{};
    }

    size_t readSize = static_cast<size_t>(std::min<uint64_t>(chunkBytes, remainingBytes));
    Chunk buf(readSize);
    in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(readSize));
    if (static_cast<size_t>(in.gcount()) != readSize) {
        done = true;
        return Error{ErrorCode::ReadFailure,
                     "Short read (" + std::to_string(in.gcount()) + " of " + std::to_string(readSize) +
                     " bytes) from " + filePath.string()};
    }

    remainingBytes -= readSize;
    return std::optional<Chunk>(std::move(buf));
}

}
