#include "util/Sha256Hasher.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <iterator>

namespace hashflow {

namespace {
constexpr std::array<uint32_t, 64> K = {
    0x428a2f98,0x71374491,0xb5c0fbcf,0xe9b5dba5,0x3956c25b,0x59f111f1,0x923f82a4,0xab1c5ed5,
    0xd807aa98,0x12835b01,0x243185be,0x550c7dc3,0x72be5d74,0x80deb1fe,0x9bdc06a7,0xc19bf174,
    0xe49b69c1,0xefbe4786,0x0fc19dc6,0x240ca1cc,0x2de92c6f,0x4a7484aa,0x5cb0a9dc,0x76f988da,
    0x983e5152,0xa831c66d,0xb00327c8,0xbf597fc7,0xc6e00bf3,0xd5a79147,0x06ca6351,0x14292967,
    0x27b70a85,0x2e1b2138,0x4d2c6dfc,0x53380d13,0x650a7354,0x766a0abb,0x81c2c92e,0x92722c85,
    0xa2bfe8a1,0xa81a664b,0xc24b8b70,0xc76c51a3,0xd192e819,0xd6990624,0xf40e3585,0x106aa070,
    0x19a4c116,0x1e376c08,0x2748774c,0x34b0bcb5,0x391c0cb3,0x4ed8aa4a,0x5b9cca4f,0x682e6ff3,
    0x748f82ee,0x78a5636f,0x84c87814,0x8cc70208,0x90befffa,0xa4506ceb,0xbef9a3f7,0xc67178f2
};

inline uint32_t rotr(uint32_t x, uint32_t n) { return (x >> n) | (x << (32 - n)); }

inline uint32_t bigSigma0(uint32_t x) { return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22); }
inline uint32_t bigSigma1(uint32_t x) { return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25); }
inline uint32_t smallSigma0(uint32_t x) { return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3); }
inline uint32_t smallSigma1(uint32_t x) { return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10); }
inline uint32_t choose(uint32_t e, uint32_t f, uint32_t g) { return (e & f) ^ (~e & g); }
inline uint32_t majority(uint32_t a, uint32_t b, uint32_t c) { return (a & b) ^ (a & c) ^ (b & c); }

inline uint32_t loadBigEndian(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}
}

Sha256Hasher::Sha256Hasher() { reset(); }

void Sha256Hasher::reset() {
    state[0]=0x6a09e667; state[1]=0xbb67ae85; state[2]=0x3c6ef372; state[3]=0xa54ff53a;
    state[4]=0x510e527f; state[5]=0x9b05688c; state[6]=0x1f83d9ab; state[7]=0x5be0cd19;
    totalBytes = 0; bufferLen = 0; std::memset(buffer, 0, sizeof(buffer));
}

void Sha256Hasher::update(const uint8_t* data, size_t len) {
    if (len == 0) return;
    totalBytes += len;

    // Top up a pending partial block first
    if (bufferLen > 0) {
        size_t take = std::min(len, BLOCK_SIZE - bufferLen);
        std::memcpy(buffer + bufferLen, data, take);
        bufferLen += take;
        data += take;
        len -= take;
        if (bufferLen < BLOCK_SIZE) return;
        transform(buffer);
        bufferLen = 0;
    }

    while (len >= BLOCK_SIZE) {
        transform(data);
        data += BLOCK_SIZE;
        len -= BLOCK_SIZE;
    }

    if (len > 0) {
        std::memcpy(buffer, data, len);
        bufferLen = len;
    }
}

void Sha256Hasher::update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }
void Sha256Hasher::update(const std::string& data) { update(reinterpret_cast<const uint8_t*>(data.data()), data.size()); }

std::vector<uint8_t> Sha256Hasher::digest() {
    uint64_t totalBits = totalBytes * 8ULL;
    buffer[bufferLen++] = 0x80;
    if (bufferLen > 56) {
        while (bufferLen < BLOCK_SIZE) buffer[bufferLen++] = 0;
        transform(buffer);
        bufferLen = 0;
    }
    while (bufferLen < 56) buffer[bufferLen++] = 0;
    for (int i = 7; i >= 0; --i) buffer[bufferLen++] = static_cast<uint8_t>((totalBits >> (i * 8)) & 0xff);
    transform(buffer);

    std::vector<uint8_t> out(DIGEST_SIZE);
    for (int i = 0; i < 8; ++i) {
        out[i*4+0] = static_cast<uint8_t>((state[i] >> 24) & 0xff);
        out[i*4+1] = static_cast<uint8_t>((state[i] >> 16) & 0xff);
        out[i*4+2] = static_cast<uint8_t>((state[i] >> 8) & 0xff);
        out[i*4+3] = static_cast<uint8_t>(state[i] & 0xff);
    }
    reset();
    return out;
}

std::string Sha256Hasher::toHex(const std::vector<uint8_t>& bytes) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[2*i] = hex[(bytes[i] >> 4) & 0xF];
        out[2*i+1] = hex[bytes[i] & 0xF];
    }
    return out;
}

void Sha256Hasher::transform(const uint8_t* block) {
    // Message schedule
    std::array<uint32_t, 64> w;
    for (size_t t = 0; t < 16; ++t) {
        w[t] = loadBigEndian(block + t * 4);
    }
    for (size_t t = 16; t < 64; ++t) {
        w[t] = smallSigma1(w[t - 2]) + w[t - 7] + smallSigma0(w[t - 15]) + w[t - 16];
    }

    std::array<uint32_t, 8> v;
    std::copy(std::begin(state), std::end(state), v.begin());
    for (size_t t = 0; t < 64; ++t) {
        uint32_t t1 = v[7] + bigSigma1(v[4]) + choose(v[4], v[5], v[6]) + K[t] + w[t];
        uint32_t t2 = bigSigma0(v[0]) + majority(v[0], v[1], v[2]);
        // Rotate the working variables: h <- g <- ... <- a
        for (size_t i = 7; i > 0; --i) v[i] = v[i - 1];
        v[4] += t1;
        v[0] = t1 + t2;
    }
    for (size_t i = 0; i < 8; ++i) state[i] += v[i];
}

}
