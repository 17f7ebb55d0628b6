#pragma once

// ============================================================
// file_io.hpp -- Memory-mapped file I/O
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const char* data() const { return data_; }
    u64 size() const { return size_; }

    // Get pointer to chunk at given offset, clamped to available bytes
    const char* chunk_ptr(u64 offset) const {
        if (offset >= size_) return nullptr;
        return data_ + offset;
    }

    u64 chunk_len(u64 offset, u64 max_len) const {
        if (offset >= size_) return 0;
        u64 remaining = size_ - offset;
        return remaining < max_len ? remaining : max_len;
    }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};
    int fd_{-1};
};

// ---- MmapWriter: file of known size filled at arbitrary offsets ----
class MmapWriter {
public:
    MmapWriter() = default;
    ~MmapWriter();

    MmapWriter(const MmapWriter&) = delete;
    MmapWriter& operator=(const MmapWriter&) = delete;

    // Create/truncate file, preallocate to size, then mmap. On failure
    // the file is removed again and std::runtime_error is thrown.
    void open(const std::string& path, u64 size);

    // Write data at given offset
    void write_at(u64 offset, const void* data, size_t len);

    // Flush and close
    void close();

    bool is_open() const { return fd_ >= 0; }
    u64 size() const { return size_; }
    const std::string& path() const { return path_; }

private:
    char* data_{nullptr};
    u64   size_{0};
    int   fd_{-1};
    std::string path_;

    void abandon();
};

// ---- Utility functions ----

// Map a logical file name onto a path under root_dir. A leading '/' is
// dropped ("/store/a.root" -> root/store/a.root). Throws if the name would
// escape root_dir.
fs::path lfn_to_path(const fs::path& root_dir, const std::string& lfn);

// Directory name for one (dataset, block): 16 hex digits of the SHA-256
// of "dataset\nblock". Keeps equal LFNs of different blocks apart.
std::string block_dir(const std::string& dataset, const std::string& block);

// root_dir/<block_dir>/<lfn path>; throws like lfn_to_path
fs::path storage_path(const fs::path& root_dir, const std::string& dataset,
                      const std::string& block, const std::string& lfn);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Move a finished file to its final location (replacing any previous copy)
void rename_into_place(const std::string& from, const std::string& to);

// Delete a file, ignoring errors (cleanup of partial downloads)
void remove_quietly(const std::string& path);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

// Hex SHA-256 of a whole file
std::string sha256_file(const std::string& path);

} // namespace file_io
