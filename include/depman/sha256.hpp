#pragma once

#include <depman/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace depman {

// FIPS 180-4 SHA-256, used to verify downloaded artifacts.
class SHA256 {
public:
    using Digest = std::array<uint8_t, 32>;

    SHA256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Pads and returns the digest. The object must not be fed afterwards.
    Digest finalize();

    static std::string to_hex(const Digest& digest);
    static std::string hash_hex(const std::string& input);

    // Streams the file in fixed-size chunks.
    static Result<std::string> hash_file(const std::filesystem::path& path);

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    std::array<uint8_t, 64> pending_;
    size_t pending_len_ = 0;
    uint64_t length_ = 0;
};

} // namespace depman
