#pragma once

#include <sift/result.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace sift {

// Streaming SHA-256 (FIPS 180-4). Content hashes and index fingerprints are
// lowercase hex digests produced by this class.
class Sha256 {
public:
    Sha256();

    void update(const void* data, size_t len);
    void update(std::string_view s) { update(s.data(), s.size()); }

    // Pads, processes the final block(s) and returns the digest. The object
    // must not be fed again afterwards.
    std::array<uint8_t, 32> finish();
    std::string hex_digest() { return to_hex(finish()); }

    static std::string to_hex(const std::array<uint8_t, 32>& digest);

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> pending_;
    size_t pending_len_ = 0;
    uint64_t length_ = 0;
};

std::string sha256_hex(std::string_view data);

// Hashes a file in fixed-size reads.
Result<std::string> sha256_file(const std::filesystem::path& path);

// Order-independent hash over a key -> value mapping: entries are visited in
// key order, each contributing "key\tvalue\n".
std::string fingerprint(const std::map<std::string, std::string>& entries);

} // namespace sift
