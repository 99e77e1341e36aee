#include "util/FileMetadata.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace hashflow {

Expected<FileMetadata> getFileMetadata(const fs::path& filePath) {
    FileMetadata metadata;
    std::error_code ec;

    auto status = fs::status(filePath, ec);
    if (ec) {
        return Error{ErrorCode::MetadataFailure, "Cannot stat " + filePath.string() + ": " + ec.message()};
    }
    metadata.regularFile = fs::is_regular_file(status);
    if (!metadata.regularFile) {
        return metadata;
    }

    auto size = fs::file_size(filePath, ec);
    if (ec) {
        return Error{ErrorCode::MetadataFailure, "Cannot read size of " + filePath.string() + ": " + ec.message()};
    }
    metadata.sizeBytes = static_cast<uint64_t>(size);
    return metadata;
}

fs::path resolveIdentity(const fs::path& filePath) {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(filePath, ec);
    if (ec) {
        // Fall back to a purely lexical form; identity only has to be stable
        resolved = fs::absolute(filePath, ec).lexically_normal();
        if (ec) resolved = filePath.lexically_normal();
    }
    return resolved;
}

}
