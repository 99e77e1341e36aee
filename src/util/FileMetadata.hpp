#pragma once

#include <cstdint>
#include <filesystem>

#include "util/Expected.hpp"

namespace hashflow {

/**
 * @brief Filesystem facts captured once before a file is hashed
 *
 * The size is authoritative for the whole task: the reader never
 * re-queries it, and a file that shrinks or grows while it is being read
 * fails the task.
 */
struct FileMetadata {
    uint64_t sizeBytes{0};   // File size in bytes
    bool regularFile{false}; // True for regular files (after following symlinks)
};

/**
 * @brief Read file metadata from filesystem
 *
 * Uses stat-style metadata only; the file is not read.
 *
 * @param filePath Path to file
 * @return FileMetadata, or MetadataFailure if the path cannot be queried
 */
Expected<FileMetadata> getFileMetadata(const std::filesystem::path& filePath);

/**
 * @brief Stable identity for a file path
 *
 * Absolute and lexically normalized, with symlinks in existing path
 * components resolved. Two spellings of the same file compare equal.
 */
std::filesystem::path resolveIdentity(const std::filesystem::path& filePath);

}
