#pragma once

// ============================================================
// compress.hpp -- zstd wrapper for chunk payloads
// ============================================================

#include "platform.hpp"
#include <vector>
#include <string>
#include <stdexcept>

#include <zstd.h>

namespace compress {

// Compression level 1 = fastest
static constexpr int ZSTD_LEVEL = 1;

// Compress src into a new buffer. Returns false (and leaves dst empty)
// when the compressed form would not be smaller than the input.
inline bool compress_if_smaller(const void* src, size_t src_len, std::vector<u8>& dst) {
    dst.clear();
    if (src_len == 0) return false;
    size_t cap = ZSTD_compressBound(src_len);
    dst.resize(cap);
    size_t sz = ZSTD_compress(dst.data(), cap, src, src_len, ZSTD_LEVEL);
    if (ZSTD_isError(sz)) {
        throw std::runtime_error(std::string("ZSTD compress error: ") + ZSTD_getErrorName(sz));
    }
    if (sz >= src_len) {
        dst.clear();
        return false;
    }
    dst.resize(sz);
    return true;
}

// Decompress a payload whose original length is known from the chunk header
inline std::vector<u8> decompress_to_vec(const void* src, size_t src_len, size_t raw_len) {
    std::vector<u8> buf(raw_len);
    size_t sz = ZSTD_decompress(buf.data(), raw_len, src, src_len);
    if (ZSTD_isError(sz)) {
        throw std::runtime_error(std::string("ZSTD decompress error: ") + ZSTD_getErrorName(sz));
    }
    if (sz != raw_len) {
        throw std::runtime_error("ZSTD decompressed " + std::to_string(sz) +
                                 " bytes, expected " + std::to_string(raw_len));
    }
    return buf;
}

// Skip formats that are already compressed (datasets often ship .root/.gz)
inline bool should_compress(const std::string& path) {
    static const char* const no_compress[] = {
        ".gz", ".bz2", ".xz", ".zst", ".lz4", ".zip", ".7z", ".tar",
        ".root", ".h5", ".hdf5", ".jpg", ".png", ".mp4",
        nullptr
    };

    auto dot_pos = path.rfind('.');
    if (dot_pos == std::string::npos) return true;

    std::string ext = path.substr(dot_pos);
    for (auto& c : ext) {
        if (c >= 'A' && c <= 'Z') c = (char)(c + 32);
    }
    for (int i = 0; no_compress[i]; ++i) {
        if (ext == no_compress[i]) return false;
    }
    return true;
}

} // namespace compress
