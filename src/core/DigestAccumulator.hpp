#pragma once

#include <cstdint>
#include <string>

#include "core/ChunkReader.hpp"
#include "util/Sha256Hasher.hpp"

namespace hashflow {

/**
 * @brief Running SHA-256 over a file's chunks
 *
 * Order-sensitive and unchecked: a skipped or reordered chunk produces a
 * wrong digest without any error, so the caller must feed every chunk of
 * the reader in sequence. finalize() consumes the accumulator:
 *
 *   DigestAccumulator acc;
 *   acc.update(chunk);
 *   std::string hex = std::move(acc).finalize();
 */
class DigestAccumulator {
public:
    DigestAccumulator() = default;

    DigestAccumulator(DigestAccumulator&&) = default;
    DigestAccumulator& operator=(DigestAccumulator&&) = default;
    DigestAccumulator(const DigestAccumulator&) = delete;
    DigestAccumulator& operator=(const DigestAccumulator&) = delete;

    void update(const Chunk& chunk);

    uint64_t bytesConsumed() const { return hasher.bytesHashed(); }

    /// Lowercase hex digest of everything fed so far
    std::string finalize() &&;

private:
    Sha256Hasher hasher;
};

}
