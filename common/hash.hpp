#pragma once

// ============================================================
// hash.hpp -- Checksums used by the transfer path
//   xxh3_32  : per-chunk integrity check on the wire (xxHash)
//   Sha256   : content hash recorded in the catalog (OpenSSL)
// ============================================================

#include "platform.hpp"
#include "utils.hpp"
#include <cstddef>
#include <array>
#include <string>
#include <stdexcept>

#include <openssl/evp.h>

#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

static constexpr size_t SHA256_LEN = 32;
using Digest256 = std::array<u8, SHA256_LEN>;

// Lower 32 bits of xxh3_64 of a memory buffer
inline u32 xxh3_32(const void* data, size_t len) {
    return (u32)(XXH3_64bits(data, len) & 0xFFFFFFFFull);
}

// Streaming SHA-256, fed chunk by chunk while a file arrives
class Sha256 {
public:
    Sha256() {
        ctx_ = EVP_MD_CTX_new();
        if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
        reset();
    }

    ~Sha256() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void reset() {
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
        }
        bytes_ = 0;
    }

    void update(const void* data, size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx_, data, len) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
        bytes_ += len;
    }

    // Finalizes; call reset() before reusing
    Digest256 digest() {
        Digest256 out{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1 || len != SHA256_LEN) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return out;
    }

    std::string hex_digest() {
        Digest256 d = digest();
        return utils::to_hex(d.data(), d.size());
    }

    u64 bytes() const { return bytes_; }

private:
    EVP_MD_CTX* ctx_{nullptr};
    u64         bytes_{0};
};

inline std::string sha256_hex(const void* data, size_t len) {
    Sha256 h;
    h.update(data, len);
    return h.hex_digest();
}

// Catalog hashes are compared case-insensitively
inline bool same_hash(const std::string& a, const std::string& b) {
    return !a.empty() && utils::to_lower(a) == utils::to_lower(b);
}

} // namespace hash
