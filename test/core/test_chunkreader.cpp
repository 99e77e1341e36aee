#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "test_utils.hpp"
#include "core/ChunkReader.hpp"

namespace fs = std::filesystem;

using namespace hashflow;
using namespace hashflow::test::utils;

class ChunkReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    /// Read everything, checking each chunk against the ceiling
    std::string readAll(ChunkReader& reader, size_t& chunkCount) {
        std::string out;
        chunkCount = 0;
        while (true) {
            auto next = reader.next();
            EXPECT_TRUE(next.has_value()) << next.error().message;
            if (!next || !next.value()) break;
            const Chunk& chunk = *next.value();
            EXPECT_LE(chunk.size(), reader.chunkSize());
            EXPECT_FALSE(chunk.empty());
            out.append(reinterpret_cast<const char*>(chunk.data()), chunk.size());
            ++chunkCount;
        }
        return out;
    }

    fs::path tempDir;
};

// Test: Concatenated chunks reproduce the file for assorted sizes
TEST_F(ChunkReaderTest, ChunksCoverFileExactly) {
    const size_t chunk = 64;
    for (size_t size : {0u, 1u, 63u, 64u, 65u, 128u, 1000u}) {
        fs::path file = createFileOfSize(tempDir, "f" + std::to_string(size), size, static_cast<uint32_t>(size));
        auto opened = ChunkReader::open(file, chunk);
        ASSERT_TRUE(opened.has_value()) << opened.error().message;
        ChunkReader& reader = opened.value();
        EXPECT_EQ(reader.size(), size);

        size_t count = 0;
        std::string content = readAll(reader, count);
        EXPECT_EQ(content, readFile(file)) << "size " << size;
        EXPECT_EQ(count, (size + chunk - 1) / chunk) << "size " << size;
        EXPECT_EQ(reader.remaining(), 0u);
        EXPECT_TRUE(reader.finished());
    }
}

// Test: Last chunk is exactly the remainder
TEST_F(ChunkReaderTest, LastChunkIsRemainder) {
    fs::path file = createFileOfSize(tempDir, "rem.bin", 100);
    auto opened = ChunkReader::open(file, 40);
    ASSERT_TRUE(opened.has_value());
    ChunkReader& reader = opened.value();

    std::vector<size_t> sizes;
    while (true) {
        auto next = reader.next();
        ASSERT_TRUE(next.has_value());
        if (!next.value()) break;
        sizes.push_back(next.value()->size());
    }
    EXPECT_EQ(sizes, (std::vector<size_t>{40, 40, 20}));
}

// Test: Exhausted sequence stays exhausted
TEST_F(ChunkReaderTest, OneShotSequence) {
    fs::path file = createFile(tempDir, "small.txt", "abc");
    auto opened = ChunkReader::open(file, 16);
    ASSERT_TRUE(opened.has_value());
    ChunkReader& reader = opened.value();

    auto first = reader.next();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first.value().has_value());
    for (int i = 0; i < 3; ++i) {
        auto again = reader.next();
        ASSERT_TRUE(again.has_value());
        EXPECT_FALSE(again.value().has_value());
    }
}

// Test: Missing file is an open failure
TEST_F(ChunkReaderTest, MissingFileFailsToOpen) {
    auto opened = ChunkReader::open(tempDir / "nope.bin");
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error().code, ErrorCode::OpenFailure);
}

// Test: Zero chunk size is rejected
TEST_F(ChunkReaderTest, ZeroChunkSizeRejected) {
    fs::path file = createFile(tempDir, "a.txt", "a");
    auto opened = ChunkReader::open(file, 0);
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error().code, ErrorCode::InvalidArgs);
}

// Test: File truncated after open -> short read, no partial chunk
TEST_F(ChunkReaderTest, ShrunkFileIsReadFailure) {
    fs::path file = createFileOfSize(tempDir, "shrink.bin", 100);
    auto opened = ChunkReader::open(file, 64);
    ASSERT_TRUE(opened.has_value());
    ChunkReader& reader = opened.value();

    fs::resize_file(file, 80);

    auto first = reader.next();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first.value().has_value());
    EXPECT_EQ(first.value()->size(), 64u);

    auto second = reader.next();
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::ReadFailure);

    // Sequence is over after the error
    auto third = reader.next();
    ASSERT_TRUE(third.has_value());
    EXPECT_FALSE(third.value().has_value());
}

// Test: File that grows after open is a read failure at the end
TEST_F(ChunkReaderTest, GrownFileIsReadFailure) {
    fs::path file = createFile(tempDir, "grow.txt", "0123456789");
    auto opened = ChunkReader::open(file, 4);
    ASSERT_TRUE(opened.has_value());
    ChunkReader& reader = opened.value();
    EXPECT_EQ(reader.size(), 10u);

    {
        std::ofstream out(file, std::ios::binary | std::ios::app);
        out << "extra";
    }

    for (int i = 0; i < 3; ++i) {
        auto next = reader.next();
        ASSERT_TRUE(next.has_value());
        ASSERT_TRUE(next.value().has_value());
    }
    auto end = reader.next();
    ASSERT_FALSE(end.has_value());
    EXPECT_EQ(end.error().code, ErrorCode::ReadFailure);
}

// Test: Directories are not readable as files
TEST_F(ChunkReaderTest, DirectoryIsRejected) {
    auto opened = ChunkReader::open(tempDir);
    ASSERT_FALSE(opened.has_value());
    EXPECT_TRUE(opened.error().code == ErrorCode::OpenFailure ||
                opened.error().code == ErrorCode::MetadataFailure);
}
