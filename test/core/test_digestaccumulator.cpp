#include <gtest/gtest.h>
#include <string>
#include "test_utils.hpp"
#include "core/Constants.hpp"
#include "core/DigestAccumulator.hpp"

using namespace hashflow;
using namespace hashflow::test::utils;

namespace {
Chunk toChunk(const std::string& s) {
    return Chunk(s.begin(), s.end());
}
}

// Test: Nothing fed -> digest of empty input
TEST(DigestAccumulatorTest, EmptyInput) {
    DigestAccumulator acc;
    EXPECT_EQ(std::move(acc).finalize(), Constants::EMPTY_SHA256);
}

// Test: Chunks fold in order into the whole-input digest
TEST(DigestAccumulatorTest, ChunksMatchWholeInput) {
    std::string data = patternBytes(5000, 3);
    DigestAccumulator acc;
    for (size_t off = 0; off < data.size(); off += 777) {
        acc.update(toChunk(data.substr(off, 777)));
    }
    EXPECT_EQ(acc.bytesConsumed(), data.size());
    EXPECT_EQ(std::move(acc).finalize(), sha256Hex(data));
}

// Test: Order matters (no self-check, just a different digest)
TEST(DigestAccumulatorTest, ReorderedChunksDiffer) {
    DigestAccumulator inOrder;
    inOrder.update(toChunk("hello "));
    inOrder.update(toChunk("world"));

    DigestAccumulator swapped;
    swapped.update(toChunk("world"));
    swapped.update(toChunk("hello "));

    std::string a = std::move(inOrder).finalize();
    EXPECT_EQ(a, "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
    EXPECT_NE(std::move(swapped).finalize(), a);
}

// Test: Fresh state per instance
TEST(DigestAccumulatorTest, InstancesAreIndependent) {
    DigestAccumulator a;
    DigestAccumulator b;
    a.update(toChunk("abc"));
    EXPECT_EQ(std::move(b).finalize(), Constants::EMPTY_SHA256);
    EXPECT_EQ(std::move(a).finalize(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
