#pragma once

// protocol.hpp -- Chunk frame carried in /fetch responses and /upload bodies

#include "platform.hpp"
#include <cstring>

// Magic number: "MCP1"
static constexpr u8  MESHCP_MAGIC[4] = {'M', 'C', 'P', '1'};
static constexpr u8  MESHCP_VERSION  = 1;

// Files move in fixed 1 MiB chunks; a fetch never asks for more.
static constexpr u32 TRANSFER_CHUNK_SIZE = 1u * 1024u * 1024u;
// Upper bound accepted for one frame payload (compressed data never
// exceeds the raw chunk, the slack covers zstd framing)
static constexpr u32 MAX_CHUNK_PAYLOAD   = TRANSFER_CHUNK_SIZE + 64u * 1024u;

// ---- Chunk flags ----
enum ChunkFlags : u8 {
    CHUNK_ZSTD = 0x01,  // payload is zstd-compressed
    CHUNK_LAST = 0x02,  // final chunk of the file
};

// ============================================================
// Packed structures (wire format, big-endian)
// ============================================================
#pragma pack(push, 1)

// ChunkHeader: 32 bytes fixed + data_len bytes of payload
struct ChunkHeader {
    u8  magic[4];
    u8  version;
    u8  flags;
    u8  pad[2];
    u64 file_offset;
    u32 raw_len;    // bytes after decompression
    u32 data_len;   // bytes following the header
    u32 xxh3_32;    // over the raw bytes
    u8  pad2[4];
};
static_assert(sizeof(ChunkHeader) == 32, "ChunkHeader size mismatch");

#pragma pack(pop)

inline bool chunk_header_valid_magic(const ChunkHeader& h) {
    return std::memcmp(h.magic, MESHCP_MAGIC, 4) == 0 && h.version == MESHCP_VERSION;
}
