#include "test_utils.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include "util/Sha256Hasher.hpp"

namespace fs = std::filesystem;

namespace hashflow::test {

namespace utils {

fs::path createTempDir() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string dirname = "hashflow_test_";
    for (int i = 0; i < 8; ++i) {
        dirname += "0123456789abcdef"[dis(gen)];
    }

    fs::path tempDir = fs::temp_directory_path() / dirname;
    fs::create_directories(tempDir);
    return tempDir;
}

void removeDir(const fs::path& dir) {
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        fs::remove_all(dir, ec);
    }
}

fs::path createFile(
    const fs::path& baseDir,
    const std::string& filename,
    const std::string& content
) {
    fs::path filePath = baseDir / filename;

    // Create parent directories if needed
    fs::create_directories(filePath.parent_path());

    std::ofstream file(filePath, std::ios::binary);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();

    return filePath;
}

std::string patternBytes(size_t size, uint32_t seed) {
    std::mt19937 gen(seed);
    std::string out(size, '\0');
    for (auto& c : out) {
        c = static_cast<char>(gen() & 0xff);
    }
    return out;
}

fs::path createFileOfSize(
    const fs::path& baseDir,
    const std::string& filename,
    size_t size,
    uint32_t seed
) {
    return createFile(baseDir, filename, patternBytes(size, seed));
}

std::string readFile(const fs::path& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::string sha256Hex(const std::string& data) {
    Sha256Hasher hasher;
    hasher.update(data);
    return Sha256Hasher::toHex(hasher.digest());
}

} // namespace utils

bool RecordingSink::send(const FileState& state) {
    std::scoped_lock lock(mtx);
    ++attempts;
    if (received.size() >= acceptLimit) return false;
    received.push_back(state);
    return true;
}

std::vector<FileState> RecordingSink::states() const {
    std::scoped_lock lock(mtx);
    return received;
}

size_t RecordingSink::sendAttempts() const {
    std::scoped_lock lock(mtx);
    return attempts;
}

} // namespace hashflow::test
