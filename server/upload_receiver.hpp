#pragma once

// ============================================================
// upload_receiver.hpp -- Files pushed to this agent via POST /upload
//
// Each request carries one chunk frame; chunks of one file arrive in
// offset order starting at 0. The final chunk triggers SHA-256
// verification, the move into storage and the catalog commit. Any
// error drops the partial upload; the sender restarts at offset 0.
// Files land at <storage>/<block dir>/<lfn>; a name cataloged with
// another hash is never replaced.
// ============================================================

#include "../common/records.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "catalog.hpp"
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>

// Query parameters of an upload request
struct UploadMeta {
    std::string lfn;
    std::string dataset;
    std::string block;
    i64         bytes{0};
    std::string hash;
};

enum class UploadStatus {
    PARTIAL,    // chunk stored, more expected
    COMPLETE,   // file verified, stored and cataloged
};

class UploadReceiver {
public:
    static constexpr u64 DEFAULT_MAX_BYTES = 100ull * 1024 * 1024 * 1024;

    // Partial uploads idle for longer than idle_timeout_ms are discarded.
    // Files larger than max_bytes are refused.
    UploadReceiver(std::string storage, Catalog& catalog, u64 idle_timeout_ms = 600000,
                   u64 max_bytes = DEFAULT_MAX_BYTES);
    ~UploadReceiver();

    UploadReceiver(const UploadReceiver&) = delete;
    UploadReceiver& operator=(const UploadReceiver&) = delete;

    // Throws std::invalid_argument for a malformed request, TransientError
    // for a corrupt chunk or content, PermanentError when the name is
    // cataloged with another hash, StorageError when the file cannot be
    // stored, CatalogError if the commit fails.
    UploadStatus on_chunk(const UploadMeta& meta, const std::string& frame);

    size_t active_uploads() const;
    u64    max_bytes() const { return max_bytes_; }

private:
    struct UploadState {
        UploadMeta          meta;
        std::string         tmp_path;
        std::string         final_path;
        file_io::MmapWriter writer;
        hash::Sha256        hasher;
        u64                 next_offset{0};
        u64                 last_activity_ms{0};
        std::mutex          mutex;
    };

    std::string storage_;
    Catalog&    catalog_;
    u64         idle_timeout_ms_;
    u64         max_bytes_;

    mutable std::mutex                                  states_mutex_;
    std::map<std::string, std::shared_ptr<UploadState>> states_;
    std::atomic<u64>                                    counter_{0};

    static std::string key_of(const UploadMeta& meta);

    // Refuse sizes over the limit or the free space, and names
    // cataloged with another hash
    void check_admission(const UploadMeta& meta);

    std::shared_ptr<UploadState> start(const UploadMeta& meta, const std::string& final_path);
    void drop(const std::string& key, const std::shared_ptr<UploadState>& state);
    void expire_stale();
};
