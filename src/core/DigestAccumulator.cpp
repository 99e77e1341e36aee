#include "core/DigestAccumulator.hpp"

namespace hashflow {

void DigestAccumulator::update(const Chunk& chunk) {
    hasher.update(chunk.data(), chunk.size());
}

std::string DigestAccumulator::finalize() && {
    return Sha256Hasher::toHex(hasher.digest());
}

}
