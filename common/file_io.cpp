// ============================================================
// file_io.cpp -- Memory-mapped file I/O implementation
// ============================================================

#include "file_io.hpp"
#include "hash.hpp"
#include <vector>
#include <cstring>
#include <cstdio>
#include <cerrno>
#include <stdexcept>
#include <string>
#include <algorithm>
#include <filesystem>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + " (" + strerror(errno) + ")");
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("fstat failed: " + path);
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("mmap failed: " + path);
    }
    // /fetch walks the file front to back in TRANSFER_CHUNK_SIZE steps
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    data_ = static_cast<const char*>(p);
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    size_ = 0;
}

// ============================================================
// MmapWriter
// ============================================================

MmapWriter::~MmapWriter() {
    if (is_open()) {
        try {
            close();
        } catch (const std::exception& e) {
            std::fprintf(stderr, "MmapWriter: close failed for %s: %s\n", path_.c_str(), e.what());
        }
    }
}

void MmapWriter::open(const std::string& file_path, u64 size) {
    path_ = file_path;
    size_ = size;

    ensure_parent_dirs(file_path);

    fd_ = ::open(file_path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
    if (fd_ < 0) {
        size_ = 0;
        throw std::runtime_error("Cannot create file: " + file_path + " (" + strerror(errno) + ")");
    }

    if (size == 0) {
        data_ = nullptr;
        return;
    }

    int rc = posix_fallocate(fd_, 0, (off_t)size);
    if (rc != 0 && ftruncate(fd_, (off_t)size) != 0) {
        int err = errno;
        abandon();
        throw std::runtime_error("Cannot size file: " + file_path + " to " +
                                 std::to_string(size) + " bytes (" + strerror(err) + ")");
    }

    void* p = mmap(nullptr, (size_t)size, PROT_WRITE, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        int err = errno;
        abandon();
        throw std::runtime_error("mmap(write) failed: " + file_path + " (" + strerror(err) + ")");
    }
    data_ = static_cast<char*>(p);
}

// Close and unlink a file that open() could not set up
void MmapWriter::abandon() {
    ::close(fd_);
    fd_   = -1;
    size_ = 0;
    ::unlink(path_.c_str());
}

void MmapWriter::write_at(u64 offset, const void* data, size_t len) {
    if (len == 0) return;
    if (!data_ || offset + len > size_) {
        throw std::runtime_error("MmapWriter::write_at out of bounds: " + path_);
    }
    std::memcpy(data_ + offset, data, len);
}

void MmapWriter::close() {
    bool sync_failed = false;
    if (data_ && size_ > 0) {
        sync_failed = msync(data_, (size_t)size_, MS_SYNC) != 0;
        munmap(data_, (size_t)size_);
        data_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    size_ = 0;
    if (sync_failed) {
        throw std::runtime_error("msync failed: " + path_);
    }
}

// ============================================================
// Utility functions
// ============================================================

fs::path file_io::lfn_to_path(const fs::path& root_dir, const std::string& lfn) {
    std::string rel = lfn;
    while (!rel.empty() && (rel[0] == '/' || rel[0] == '\\')) rel.erase(0, 1);

    if (rel.empty()) {
        throw std::runtime_error("Empty logical file name: '" + lfn + "'");
    }
    if (rel.find('\0') != std::string::npos) {
        throw std::runtime_error("NUL byte in logical file name");
    }
    for (auto& part : fs::path(rel)) {
        if (part == "..") {
            throw std::runtime_error("Path traversal rejected: " + lfn);
        }
    }

    fs::path full = (root_dir / rel).lexically_normal();
    auto root_str = root_dir.lexically_normal().string();
    if (full.string().compare(0, root_str.size(), root_str) != 0) {
        throw std::runtime_error("Path escapes storage root: " + lfn);
    }
    return full;
}

std::string file_io::block_dir(const std::string& dataset, const std::string& block) {
    std::string key = dataset + "\n" + block;
    return hash::sha256_hex(key.data(), key.size()).substr(0, 16);
}

fs::path file_io::storage_path(const fs::path& root_dir, const std::string& dataset,
                               const std::string& block, const std::string& lfn)
{
    if (dataset.empty() || block.empty()) {
        throw std::runtime_error("Storage path of " + lfn + " needs dataset and block");
    }
    return lfn_to_path(root_dir / block_dir(dataset, block), lfn);
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

void file_io::rename_into_place(const std::string& from, const std::string& to) {
    ensure_parent_dirs(to);
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        // Storage and temp area on different filesystems
        fs::copy_file(from, to, fs::copy_options::overwrite_existing);
        fs::remove(from, ec);
    }
}

void file_io::remove_quietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) return 0;
    return (u64)sz;
}

std::string file_io::sha256_file(const std::string& path) {
    MmapReader reader(path);
    hash::Sha256 h;
    for (u64 off = 0; off < reader.size(); off += (1u << 20)) {
        u64 len = reader.chunk_len(off, 1u << 20);
        h.update(reader.chunk_ptr(off), (size_t)len);
    }
    return h.hex_digest();
}
