#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hashflow {

/**
 * @brief Streaming SHA-256 (FIPS 180-4)
 *
 * Full 64-byte blocks are compressed straight from the caller's buffer;
 * only a trailing partial block is copied into the internal buffer.
 * Produces 256-bit (32-byte) digests.
 *
 * Usage:
 *   Sha256Hasher h;
 *   h.update(chunk.data(), chunk.size());
 *   std::string hex = Sha256Hasher::toHex(h.digest());
 */
class Sha256Hasher {
public:
    static constexpr size_t DIGEST_SIZE = 32;
    static constexpr size_t BLOCK_SIZE = 64;

    Sha256Hasher();

    /// Reset hasher state to initial values
    void reset();

    /// Update hash with raw byte data
    void update(const uint8_t* data, size_t len);

    /// Update hash with vector of bytes
    void update(const std::vector<uint8_t>& data);

    /// Update hash with string content
    void update(const std::string& data);

    /// Finalize and return 32-byte digest (resets state after)
    std::vector<uint8_t> digest();

    /// Total bytes fed since the last reset
    uint64_t bytesHashed() const { return totalBytes; }

    /// Convert binary hash to lowercase hex string
    static std::string toHex(const std::vector<uint8_t>& bytes);

private:
    void transform(const uint8_t* block);

    uint32_t state[8];           // Current hash state (H0..H7)
    uint64_t totalBytes;         // Bytes processed, for the length suffix
    uint8_t buffer[BLOCK_SIZE];  // Pending partial block
    size_t bufferLen;            // Current buffer fill
};

}
