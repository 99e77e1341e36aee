#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "core/EventSink.hpp"
#include "core/FileState.hpp"

namespace hashflow::test {

/**
 * @brief Test utilities for Hashflow tests
 *
 * Temporary directories, test files with known content, and a sink that
 * records what a pipeline sends.
 */
namespace utils {

/**
 * @brief Create a temporary directory for testing
 * @return Path to temporary directory
 */
std::filesystem::path createTempDir();

/**
 * @brief Remove a directory and all its contents
 * @param dir Directory to remove
 */
void removeDir(const std::filesystem::path& dir);

/**
 * @brief Create a file with content in the given directory
 * @return Full path to created file
 */
std::filesystem::path createFile(
    const std::filesystem::path& baseDir,
    const std::string& filename,
    const std::string& content = ""
);

/**
 * @brief Deterministic pseudo-random bytes (same seed, same bytes)
 */
std::string patternBytes(size_t size, uint32_t seed = 1);

/**
 * @brief Create a file of `size` bytes filled with patternBytes(size, seed)
 * @return Full path to created file
 */
std::filesystem::path createFileOfSize(
    const std::filesystem::path& baseDir,
    const std::string& filename,
    size_t size,
    uint32_t seed = 1
);

/**
 * @brief Read file content (binary)
 */
std::string readFile(const std::filesystem::path& filePath);

/**
 * @brief One-shot SHA-256 hex of a string, used as the expected value
 */
std::string sha256Hex(const std::string& data);

} // namespace utils

/**
 * @brief EventSink that stores every state it is given
 *
 * acceptCount limits how many sends succeed; later sends return false as
 * if the receiver had gone away.
 */
class RecordingSink : public EventSink {
public:
    explicit RecordingSink(size_t acceptCount = SIZE_MAX) : acceptLimit(acceptCount) {}

    bool send(const FileState& state) override;

    std::vector<FileState> states() const;
    size_t sendAttempts() const;

private:
    mutable std::mutex mtx;
    std::vector<FileState> received;
    size_t attempts{0};
    size_t acceptLimit;
};

} // namespace hashflow::test
