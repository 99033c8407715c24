#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace dawn {

// SHA256
std::vector<uint8_t> sha256_bytes(const uint8_t* data, size_t n);
std::string sha256_hex(const uint8_t* data, size_t n);
inline std::string sha256_hex(const std::string& s) {
    return sha256_hex(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// Incremental SHA256 for inputs that do not fit (or should not be held) in memory.
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) {
        update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    // Finalizes the digest. The hasher must not be updated afterwards.
    std::vector<uint8_t> finish();
    std::string finish_hex();

private:
    uint32_t state_[8];
    uint8_t block_[64];
    size_t block_len_{0};
    uint64_t total_len_{0};
};

// Constant-time string equality (for comparing hex digests)
bool constant_time_eq(const std::string& a, const std::string& b);

// SHA256 of a file's contents, read in 4 KiB chunks (empty string on error)
std::string sha256_hex_file(const std::filesystem::path& path);

// Cryptographically secure 32-bit random
uint32_t secure_rand32();

// Random RFC 4122 version 4 UUID, lowercase hex with dashes.
std::string uuid4();

} // namespace dawn
