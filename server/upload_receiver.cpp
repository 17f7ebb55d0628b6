// ============================================================
// upload_receiver.cpp
// ============================================================

#include "upload_receiver.hpp"
#include "../common/protocol_io.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

UploadReceiver::UploadReceiver(std::string storage, Catalog& catalog, u64 idle_timeout_ms,
                               u64 max_bytes)
    : storage_(std::move(storage)), catalog_(catalog), idle_timeout_ms_(idle_timeout_ms),
      max_bytes_(max_bytes)
{
    fs::create_directories(fs::path(storage_) / ".meshcp" / "tmp");
}

UploadReceiver::~UploadReceiver() {
    std::lock_guard<std::mutex> lk(states_mutex_);
    for (auto& [key, state] : states_) {
        std::lock_guard<std::mutex> slk(state->mutex);
        if (state->writer.is_open()) {
            try {
                state->writer.close();
            } catch (const std::exception& e) {
                LOG_WARN("Closing partial upload " + state->meta.lfn + ": " + e.what());
            }
        }
        file_io::remove_quietly(state->tmp_path);
    }
}

std::string UploadReceiver::key_of(const UploadMeta& meta) {
    return meta.dataset + "\n" + meta.block + "\n" + meta.lfn;
}

size_t UploadReceiver::active_uploads() const {
    std::lock_guard<std::mutex> lk(states_mutex_);
    return states_.size();
}

void UploadReceiver::check_admission(const UploadMeta& meta) {
    u64 size = (u64)meta.bytes;
    if (size > max_bytes_) {
        throw StorageError("upload of " + meta.lfn + " (" + utils::format_bytes(size) +
                           ") exceeds the limit of " + utils::format_bytes(max_bytes_),
                           StorageError::TOO_LARGE);
    }

    std::error_code ec;
    fs::space_info space = fs::space(storage_, ec);
    if (ec) {
        throw StorageError("cannot query free space of " + storage_ + ": " + ec.message());
    }
    if (size > (u64)space.available) {
        throw StorageError("upload of " + meta.lfn + " (" + utils::format_bytes(size) +
                           ") exceeds the free space of " + utils::format_bytes((u64)space.available));
    }

    TransferRequest filter;
    filter.dataset = meta.dataset;
    filter.block   = meta.block;
    filter.file    = meta.lfn;
    std::vector<CatalogEntry> local;
    if (!catalog_.query(filter, local)) {
        throw CatalogError("catalog lookup of " + meta.lfn + " failed");
    }
    for (auto& e : local) {
        if (!hash::same_hash(e.hash, meta.hash)) {
            throw PermanentError(meta.lfn + " in " + meta.block + " is cataloged with hash " +
                                 e.hash + ", upload has " + meta.hash);
        }
    }
}

std::shared_ptr<UploadReceiver::UploadState>
UploadReceiver::start(const UploadMeta& meta, const std::string& final_path) {
    check_admission(meta);

    auto state = std::make_shared<UploadState>();
    state->meta       = meta;
    state->final_path = final_path;
    state->tmp_path   = (fs::path(storage_) / ".meshcp" / "tmp" /
                         ("upload-" + std::to_string(++counter_) + ".part")).string();
    try {
        state->writer.open(state->tmp_path, (u64)meta.bytes);
    } catch (const std::runtime_error& e) {
        file_io::remove_quietly(state->tmp_path);
        throw StorageError(std::string("cannot create upload file: ") + e.what());
    }
    state->last_activity_ms = utils::now_ms();

    std::shared_ptr<UploadState> previous;
    {
        std::lock_guard<std::mutex> lk(states_mutex_);
        auto it = states_.find(key_of(meta));
        if (it != states_.end()) previous = it->second;
        states_[key_of(meta)] = state;
    }
    if (previous) {
        LOG_WARN("Restarting upload of " + meta.lfn);
        std::lock_guard<std::mutex> lk(previous->mutex);
        if (previous->writer.is_open()) {
            try {
                previous->writer.close();
            } catch (const std::exception& e) {
                LOG_WARN("Closing abandoned upload " + meta.lfn + ": " + e.what());
            }
        }
        file_io::remove_quietly(previous->tmp_path);
    }
    LOG_INFO("Receiving upload " + meta.lfn + " (" + utils::format_bytes((u64)meta.bytes) + ")");
    return state;
}

// Caller holds state->mutex
void UploadReceiver::drop(const std::string& key, const std::shared_ptr<UploadState>& state) {
    {
        std::lock_guard<std::mutex> lk(states_mutex_);
        auto it = states_.find(key);
        if (it != states_.end() && it->second == state) states_.erase(it);
    }
    if (state->writer.is_open()) {
        try {
            state->writer.close();
        } catch (const std::exception& e) {
            LOG_WARN("Closing dropped upload " + state->meta.lfn + ": " + e.what());
        }
    }
    file_io::remove_quietly(state->tmp_path);
}

void UploadReceiver::expire_stale() {
    std::vector<std::pair<std::string, std::shared_ptr<UploadState>>> stale;
    u64 now = utils::now_ms();
    {
        std::lock_guard<std::mutex> lk(states_mutex_);
        for (auto& [key, state] : states_) {
            if (now - state->last_activity_ms > idle_timeout_ms_) stale.emplace_back(key, state);
        }
    }
    for (auto& [key, state] : stale) {
        std::lock_guard<std::mutex> lk(state->mutex);
        LOG_WARN("Expiring idle upload of " + state->meta.lfn);
        drop(key, state);
    }
}

UploadStatus UploadReceiver::on_chunk(const UploadMeta& meta, const std::string& frame) {
    if (meta.lfn.empty() || meta.dataset.empty() || meta.block.empty() || meta.hash.empty()) {
        throw std::invalid_argument("upload needs lfn, dataset, block and hash");
    }
    if (meta.bytes < 0) {
        throw std::invalid_argument("upload size must not be negative");
    }
    std::string final_path;
    try {
        final_path = file_io::storage_path(storage_, meta.dataset, meta.block, meta.lfn).string();
    } catch (const std::runtime_error& e) {
        throw std::invalid_argument(e.what());
    }

    expire_stale();

    proto::Chunk chunk = proto::decode_chunk(frame);
    std::string key = key_of(meta);

    std::shared_ptr<UploadState> state;
    if (chunk.offset == 0) {
        state = start(meta, final_path);
    } else {
        std::lock_guard<std::mutex> lk(states_mutex_);
        auto it = states_.find(key);
        if (it == states_.end()) {
            throw std::invalid_argument("no upload of " + meta.lfn + " in progress at offset " +
                                        std::to_string(chunk.offset));
        }
        state = it->second;
    }

    std::lock_guard<std::mutex> lk(state->mutex);
    try {
        if (chunk.offset != state->next_offset) {
            throw TransientError("upload chunk at offset " + std::to_string(chunk.offset) +
                                 ", expected " + std::to_string(state->next_offset));
        }
        if (state->meta.bytes != meta.bytes || !hash::same_hash(state->meta.hash, meta.hash)) {
            throw std::invalid_argument("upload metadata changed mid-transfer for " + meta.lfn);
        }
        if (chunk.offset + chunk.data.size() > (u64)meta.bytes) {
            throw TransientError("upload of " + meta.lfn + " exceeds declared size " +
                                 std::to_string(meta.bytes));
        }

        state->writer.write_at(chunk.offset, chunk.data.data(), chunk.data.size());
        state->hasher.update(chunk.data.data(), chunk.data.size());
        state->next_offset     += chunk.data.size();
        state->last_activity_ms = utils::now_ms();

        if (!chunk.last) return UploadStatus::PARTIAL;

        state->writer.close();
        if (state->next_offset != (u64)meta.bytes) {
            throw TransientError("upload of " + meta.lfn + " ended at " +
                                 std::to_string(state->next_offset) + " of " +
                                 std::to_string(meta.bytes) + " bytes");
        }
        std::string got = state->hasher.hex_digest();
        if (!hash::same_hash(meta.hash, got)) {
            throw TransientError("upload hash mismatch for " + meta.lfn + ": expected " +
                                 meta.hash + ", got " + got);
        }

        CatalogEntry entry;
        entry.lfn     = meta.lfn;
        entry.pfn     = fs::absolute(state->final_path).string();
        entry.dataset = meta.dataset;
        entry.block   = meta.block;
        entry.bytes   = meta.bytes;
        entry.hash    = got;

        CommitResult res = catalog_.commit_file(entry, [&] {
            file_io::rename_into_place(state->tmp_path, state->final_path);
        });
        file_io::remove_quietly(state->tmp_path);
        if (res == CommitResult::CONFLICT) {
            throw PermanentError(meta.lfn + " in " + meta.block +
                                 " was cataloged with another hash during the upload");
        }

        {
            std::lock_guard<std::mutex> slk(states_mutex_);
            auto it = states_.find(key);
            if (it != states_.end() && it->second == state) states_.erase(it);
        }
        LOG_INFO("Upload complete: " + entry.to_string());
        return UploadStatus::COMPLETE;
    } catch (const std::exception& e) {
        LOG_WARN("Upload of " + meta.lfn + " dropped: " + e.what());
        drop(key, state);
        throw;
    }
}
