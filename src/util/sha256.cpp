#include <depman/sha256.hpp>
#include <algorithm>
#include <cstring>
#include <fstream>

namespace depman {

namespace {

constexpr uint32_t kRound[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

constexpr std::array<uint32_t, 8> kInitial = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
};

inline uint32_t rotr(uint32_t x, unsigned n) {
    return (x >> n) | (x << (32 - n));
}

inline uint32_t load_be32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
           (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

} // namespace

SHA256::SHA256() : h_(kInitial) {
    pending_.fill(0);
}

void SHA256::compress(const uint8_t* block) {
    uint32_t w[64];
    for (int i = 0; i < 16; ++i) {
        w[i] = load_be32(block + 4 * i);
    }
    for (int i = 16; i < 64; ++i) {
        uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    std::array<uint32_t, 8> v = h_;
    for (int i = 0; i < 64; ++i) {
        uint32_t e = v[4];
        uint32_t a = v[0];
        uint32_t t1 = v[7] + (rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25)) +
                      ((e & v[5]) ^ (~e & v[6])) + kRound[i] + w[i];
        uint32_t t2 = (rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22)) +
                      ((a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]));
        v[7] = v[6];
        v[6] = v[5];
        v[5] = v[4];
        v[4] = v[3] + t1;
        v[3] = v[2];
        v[2] = v[1];
        v[1] = v[0];
        v[0] = t1 + t2;
    }

    for (size_t i = 0; i < 8; ++i) {
        h_[i] += v[i];
    }
}

void SHA256::update(const uint8_t* data, size_t len) {
    length_ += len;

    while (len > 0) {
        if (pending_len_ == 0 && len >= 64) {
            compress(data);
            data += 64;
            len -= 64;
            continue;
        }
        size_t take = std::min(len, 64 - pending_len_);
        std::memcpy(pending_.data() + pending_len_, data, take);
        pending_len_ += take;
        data += take;
        len -= take;
        if (pending_len_ == 64) {
            compress(pending_.data());
            pending_len_ = 0;
        }
    }
}

void SHA256::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

SHA256::Digest SHA256::finalize() {
    uint64_t bit_length = length_ * 8;

    // 0x80, zeros up to 56 mod 64, then the 64-bit big-endian bit length
    uint8_t tail[72] = {0x80};
    size_t pad = (pending_len_ < 56) ? (56 - pending_len_) : (120 - pending_len_);
    for (int i = 0; i < 8; ++i) {
        tail[pad + i] = uint8_t(bit_length >> (56 - 8 * i));
    }
    update(tail, pad + 8);

    Digest out{};
    for (size_t i = 0; i < 8; ++i) {
        out[4 * i]     = uint8_t(h_[i] >> 24);
        out[4 * i + 1] = uint8_t(h_[i] >> 16);
        out[4 * i + 2] = uint8_t(h_[i] >> 8);
        out[4 * i + 3] = uint8_t(h_[i]);
    }
    return out;
}

std::string SHA256::to_hex(const Digest& digest) {
    static const char* digits = "0123456789abcdef";
    std::string hex;
    hex.reserve(64);
    for (uint8_t b : digest) {
        hex += digits[b >> 4];
        hex += digits[b & 0x0f];
    }
    return hex;
}

std::string SHA256::hash_hex(const std::string& input) {
    SHA256 ctx;
    ctx.update(input);
    return to_hex(ctx.finalize());
}

Result<std::string> SHA256::hash_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return DepmanError{DepmanError::IO,
            "cannot open for hashing: " + path.string()};
    }

    SHA256 ctx;
    char buf[64 * 1024];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0) {
            ctx.update(reinterpret_cast<const uint8_t*>(buf), static_cast<size_t>(n));
        }
    }
    if (in.bad()) {
        return DepmanError{DepmanError::IO,
            "read error while hashing: " + path.string()};
    }
    return Result<std::string>::ok(to_hex(ctx.finalize()));
}

} // namespace depman
