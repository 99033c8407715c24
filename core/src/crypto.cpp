#include "dawn/crypto.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>

#if defined(__linux__)
  #include <sys/random.h>
#endif

namespace dawn {

namespace {

constexpr std::array<uint32_t, 64> K = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u
};

constexpr uint32_t H0[8] = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u
};

inline uint32_t rotr(uint32_t x, uint32_t n) { return (x >> n) | (x << (32 - n)); }
inline uint32_t ch(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (~x & z); }
inline uint32_t maj(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (x & z) ^ (y & z); }
inline uint32_t bsig0(uint32_t x) { return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22); }
inline uint32_t bsig1(uint32_t x) { return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25); }
inline uint32_t ssig0(uint32_t x) { return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3); }
inline uint32_t ssig1(uint32_t x) { return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10); }

static void transform(uint32_t state[8], const uint8_t block[64]) {
    uint32_t w[64];
    for (int i = 0; i < 16; i++) {
        w[i] = (uint32_t(block[i*4+0]) << 24) |
               (uint32_t(block[i*4+1]) << 16) |
               (uint32_t(block[i*4+2]) << 8) |
               (uint32_t(block[i*4+3]) << 0);
    }
    for (int i = 16; i < 64; i++) {
        w[i] = ssig1(w[i-2]) + w[i-7] + ssig0(w[i-15]) + w[i-16];
    }

    uint32_t a = state[0], b = state[1], c = state[2], d = state[3];
    uint32_t e = state[4], f = state[5], g = state[6], h = state[7];

    for (int i = 0; i < 64; i++) {
        uint32_t t1 = h + bsig1(e) + ch(e,f,g) + K[i] + w[i];
        uint32_t t2 = bsig0(a) + maj(a,b,c);
        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    state[0] += a; state[1] += b; state[2] += c; state[3] += d;
    state[4] += e; state[5] += f; state[6] += g; state[7] += h;
}

static std::string to_hex(const std::vector<uint8_t>& b) {
    static const char* H = "0123456789abcdef";
    std::string out;
    out.resize(b.size() * 2);
    for (size_t i = 0; i < b.size(); i++) {
        out[i*2+0] = H[(b[i] >> 4) & 0xF];
        out[i*2+1] = H[(b[i] >> 0) & 0xF];
    }
    return out;
}

} // namespace

// ---------- Sha256 (streaming) ----------

Sha256::Sha256() {
    std::memcpy(state_, H0, sizeof(state_));
    std::memset(block_, 0, sizeof(block_));
}

void Sha256::update(const uint8_t* data, size_t n) {
    total_len_ += n;
    size_t off = 0;

    // top up a partially filled block first
    if (block_len_ > 0) {
        size_t take = std::min(n, sizeof(block_) - block_len_);
        std::memcpy(block_ + block_len_, data, take);
        block_len_ += take;
        off += take;
        if (block_len_ < sizeof(block_)) return;
        transform(state_, block_);
        block_len_ = 0;
    }

    while (off + 64 <= n) {
        transform(state_, data + off);
        off += 64;
    }

    if (off < n) {
        std::memcpy(block_, data + off, n - off);
        block_len_ = n - off;
    }
}

std::vector<uint8_t> Sha256::finish() {
    uint64_t bit_len = total_len_ * 8ull;

    // pad
    uint8_t block[64];
    std::memset(block, 0, sizeof(block));
    if (block_len_) std::memcpy(block, block_, block_len_);
    block[block_len_] = 0x80;

    if (block_len_ >= 56) {
        transform(state_, block);
        std::memset(block, 0, sizeof(block));
    }

    // length in bits big-endian
    for (int i = 0; i < 8; i++) {
        block[63 - i] = uint8_t((bit_len >> (i * 8)) & 0xFF);
    }
    transform(state_, block);

    std::vector<uint8_t> out(32);
    for (int i = 0; i < 8; i++) {
        out[i*4+0] = uint8_t((state_[i] >> 24) & 0xFF);
        out[i*4+1] = uint8_t((state_[i] >> 16) & 0xFF);
        out[i*4+2] = uint8_t((state_[i] >> 8) & 0xFF);
        out[i*4+3] = uint8_t((state_[i] >> 0) & 0xFF);
    }
    return out;
}

std::string Sha256::finish_hex() {
    return to_hex(finish());
}

std::vector<uint8_t> sha256_bytes(const uint8_t* data, size_t n) {
    Sha256 h;
    h.update(data, n);
    return h.finish();
}

std::string sha256_hex(const uint8_t* data, size_t n) {
    return to_hex(sha256_bytes(data, n));
}

bool constant_time_eq(const std::string& a, const std::string& b) {
    // Use the longer length to avoid leaking which string is shorter.
    const size_t len = (a.size() >= b.size()) ? a.size() : b.size();
    volatile uint8_t v = (a.size() != b.size()) ? 1 : 0;
    for (size_t i = 0; i < len; i++) {
        uint8_t ca = (i < a.size()) ? (uint8_t)a[i] : 0;
        uint8_t cb = (i < b.size()) ? (uint8_t)b[i] : 0;
        v |= ca ^ cb;
    }
    return v == 0;
}

std::string sha256_hex_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return "";
    Sha256 h;
    char buf[4096];
    while (f.read(buf, sizeof(buf)) || f.gcount() > 0) {
        h.update(reinterpret_cast<const uint8_t*>(buf), (size_t)f.gcount());
    }
    if (f.bad()) return "";
    return h.finish_hex();
}

uint32_t secure_rand32() {
    uint32_t v = 0;
#if defined(__linux__)
    if (::getrandom(&v, sizeof(v), 0) == (ssize_t)sizeof(v)) return v;
#endif
    FILE* f = std::fopen("/dev/urandom", "rb");
    if (f) {
        size_t got = std::fread(&v, sizeof(v), 1, f);
        std::fclose(f);
        if (got == 1) return v;
    }
    // never fall back to a predictable value
    throw std::runtime_error("secure_rand32: cannot obtain random bytes");
}

std::string uuid4() {
    uint8_t b[16];
    for (int i = 0; i < 4; i++) {
        uint32_t r = secure_rand32();
        std::memcpy(b + i * 4, &r, 4);
    }
    b[6] = uint8_t((b[6] & 0x0F) | 0x40); // version 4
    b[8] = uint8_t((b[8] & 0x3F) | 0x80); // variant 10xx

    std::string hex = to_hex(std::vector<uint8_t>(b, b + 16));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace dawn
