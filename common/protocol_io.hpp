#pragma once

// ============================================================
// protocol_io.hpp -- Chunk frame encode/decode with byte-order handling
// ============================================================

#include "protocol.hpp"
#include "compress.hpp"
#include "hash.hpp"
#include "errors.hpp"
#include <string>
#include <vector>
#include <stdexcept>

#include <endian.h>

namespace proto {

// ---- Byte-order helpers ----

inline u32 hton32(u32 v) { return htobe32(v); }
inline u64 hton64(u64 v) { return htobe64(v); }
inline u32 ntoh32(u32 v) { return be32toh(v); }
inline u64 ntoh64(u64 v) { return be64toh(v); }

inline void encode_chunk_header(ChunkHeader& h) {
    h.file_offset = hton64(h.file_offset);
    h.raw_len     = hton32(h.raw_len);
    h.data_len    = hton32(h.data_len);
    h.xxh3_32     = hton32(h.xxh3_32);
}

inline void decode_chunk_header(ChunkHeader& h) {
    h.file_offset = ntoh64(h.file_offset);
    h.raw_len     = ntoh32(h.raw_len);
    h.data_len    = ntoh32(h.data_len);
    h.xxh3_32     = ntoh32(h.xxh3_32);
}

// A chunk after decompression and checksum verification
struct Chunk {
    u64             offset{0};
    bool            last{false};
    std::vector<u8> data;
};

// Build one frame. Compression is attempted only when allowed and kept
// only if it shrinks the payload.
inline std::string encode_chunk(u64 offset, const void* data, u32 raw_len,
                                bool allow_compress, bool last)
{
    std::vector<u8> comp_buf;
    const u8* send_data = static_cast<const u8*>(data);
    u32 send_len = raw_len;
    u8 flags = last ? CHUNK_LAST : 0;

    if (allow_compress && compress::compress_if_smaller(data, raw_len, comp_buf)) {
        send_data = comp_buf.data();
        send_len  = (u32)comp_buf.size();
        flags |= CHUNK_ZSTD;
    }

    ChunkHeader hdr{};
    std::memcpy(hdr.magic, MESHCP_MAGIC, 4);
    hdr.version     = MESHCP_VERSION;
    hdr.flags       = flags;
    hdr.file_offset = offset;
    hdr.raw_len     = raw_len;
    hdr.data_len    = send_len;
    hdr.xxh3_32     = raw_len > 0 ? hash::xxh3_32(data, raw_len) : 0;
    encode_chunk_header(hdr);

    std::string frame(sizeof(ChunkHeader) + send_len, '\0');
    std::memcpy(&frame[0], &hdr, sizeof(ChunkHeader));
    if (send_len > 0) {
        std::memcpy(&frame[sizeof(ChunkHeader)], send_data, send_len);
    }
    return frame;
}

// Parse and verify one frame. Malformed frames and checksum mismatches
// raise TransientError.
inline Chunk decode_chunk(const std::string& frame) {
    if (frame.size() < sizeof(ChunkHeader)) {
        throw TransientError("chunk frame too short: " + std::to_string(frame.size()) + " bytes");
    }
    ChunkHeader hdr{};
    std::memcpy(&hdr, frame.data(), sizeof(ChunkHeader));
    decode_chunk_header(hdr);

    if (!chunk_header_valid_magic(hdr)) {
        throw TransientError("chunk frame has bad magic/version");
    }
    if (hdr.data_len > MAX_CHUNK_PAYLOAD || hdr.raw_len > TRANSFER_CHUNK_SIZE) {
        throw TransientError("chunk frame exceeds size limits");
    }
    if (frame.size() != sizeof(ChunkHeader) + hdr.data_len) {
        throw TransientError("chunk frame length mismatch: header says " +
                             std::to_string(hdr.data_len) + " payload bytes, got " +
                             std::to_string(frame.size() - sizeof(ChunkHeader)));
    }

    const u8* payload = reinterpret_cast<const u8*>(frame.data()) + sizeof(ChunkHeader);
    Chunk out;
    out.offset = hdr.file_offset;
    out.last   = (hdr.flags & CHUNK_LAST) != 0;

    if (hdr.flags & CHUNK_ZSTD) {
        try {
            out.data = compress::decompress_to_vec(payload, hdr.data_len, hdr.raw_len);
        } catch (const std::exception& e) {
            throw TransientError(std::string("chunk decompression failed: ") + e.what());
        }
    } else {
        if (hdr.data_len != hdr.raw_len) {
            throw TransientError("uncompressed chunk with raw_len != data_len");
        }
        out.data.assign(payload, payload + hdr.data_len);
    }

    u32 computed = out.data.empty() ? 0 : hash::xxh3_32(out.data.data(), out.data.size());
    if (computed != hdr.xxh3_32) {
        throw TransientError("chunk checksum mismatch at offset " + std::to_string(out.offset));
    }
    return out;
}

} // namespace proto
