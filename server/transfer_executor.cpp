// ============================================================
// transfer_executor.cpp
// ============================================================

#include "transfer_executor.hpp"
#include "../common/protocol_io.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <thread>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

// ============================================================
// Backoff
// ============================================================

Backoff::Backoff(u32 init_ms, u32 max_ms)
    : init_ms_(init_ms), max_ms_(max_ms), rng_(std::random_device{}())
{}

u32 Backoff::next() {
    if (current_ == 0) {
        std::uniform_int_distribution<u32> dist(1, init_ms_ > 0 ? init_ms_ : 1);
        current_ = dist(rng_);
    } else {
        current_ *= 2;
    }
    if (current_ > max_ms_) current_ = max_ms_;
    return current_;
}

// ============================================================
// TransferExecutor
// ============================================================

TransferExecutor::TransferExecutor(ExecutorConfig cfg, Catalog& catalog,
                                   AgentMesh& mesh, RemoteAgent& remote)
    : cfg_(std::move(cfg)), catalog_(catalog), mesh_(mesh), remote_(remote)
{
    if (cfg_.retry.attempts < 1) cfg_.retry.attempts = 1;
    fs::create_directories(fs::path(cfg_.storage) / ".meshcp" / "tmp");
}

template <typename Fn>
auto TransferExecutor::with_retries(const std::string& what, Fn&& fn) -> decltype(fn()) {
    Backoff backoff(cfg_.retry.backoff_init_ms, cfg_.retry.backoff_max_ms);
    std::string last_error;

    for (int attempt = 1; ; ++attempt) {
        try {
            return fn();
        } catch (const HttpError& e) {
            // The source answered and refused: asking again will not help
            if (e.status() >= 400 && e.status() < 500) {
                throw PermanentError(what + ": " + e.what());
            }
            last_error = e.what();
        } catch (const TransientError& e) {
            last_error = e.what();
        }

        if (attempt >= cfg_.retry.attempts) {
            throw TransientError(what + " failed after " + std::to_string(attempt) +
                                 " attempts: " + last_error);
        }
        u32 delay = backoff.next();
        LOG_WARN(what + ": attempt " + std::to_string(attempt) + "/" +
                 std::to_string(cfg_.retry.attempts) + " failed (" + last_error +
                 "), retrying in " + std::to_string(delay) + " ms");
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
}

JobResult TransferExecutor::run(u64 job_id, const TransferRequest& req) {
    // ---- ResolveEndpoints ----
    if (req.src_alias.empty()) {
        throw PermanentError("Transfer request names no source agent: " + req.to_string());
    }
    if (req.src_alias == mesh_.self().alias) {
        throw PermanentError("Source agent " + req.src_alias + " is this agent");
    }
    std::string src_url;
    if (!mesh_.lookup(req.src_alias, src_url)) {
        throw PermanentError("Unknown source agent '" + req.src_alias + "'");
    }

    TransferRequest filter;
    filter.dataset = req.dataset;
    filter.block   = req.block;
    filter.file    = req.file;

    std::vector<CatalogEntry> sources = with_retries(
        "Catalog query at " + req.src_alias,
        [&] { return remote_.records(src_url, filter); });
    if (sources.empty()) {
        throw PermanentError("No catalog records at " + req.src_alias + " for " + filter.to_string());
    }
    LOG_INFO("Job " + std::to_string(job_id) + ": " + std::to_string(sources.size()) +
             " files to fetch from " + req.src_alias);

    JobResult result;
    int n = 0;
    for (auto& src : sources) {
        if (already_present(src)) {
            LOG_INFO("Already have " + src.lfn + " with hash " + src.hash);
            ++result.files;
            continue;
        }
        CatalogEntry local = transfer_file(job_id, n++, src_url, src);
        ++result.files;
        result.bytes += (u64)local.bytes;
    }
    return result;
}

bool TransferExecutor::already_present(const CatalogEntry& src) {
    TransferRequest filter;
    filter.dataset = src.dataset;
    filter.block   = src.block;
    filter.file    = src.lfn;

    std::vector<CatalogEntry> local;
    if (!catalog_.query(filter, local)) return false;
    for (auto& e : local) {
        if (hash::same_hash(e.hash, src.hash)) return true;
        throw PermanentError(src.lfn + " in " + src.block + " is cataloged here with hash " +
                             e.hash + ", source has " + src.hash);
    }
    return false;
}

CatalogEntry TransferExecutor::transfer_file(u64 job_id, int n, const std::string& src_url,
                                             const CatalogEntry& src)
{
    if (src.hash.empty()) {
        throw PermanentError("Source record has no hash: " + src.to_string());
    }
    if (src.bytes < 0) {
        throw PermanentError("Source record has negative size: " + src.to_string());
    }

    fs::path final_path;
    try {
        final_path = file_io::storage_path(cfg_.storage, src.dataset, src.block, src.lfn);
    } catch (const std::runtime_error& e) {
        throw PermanentError(e.what());
    }
    std::string tmp_path = (fs::path(cfg_.storage) / ".meshcp" / "tmp" /
                            (std::to_string(job_id) + "-" + std::to_string(n) + ".part")).string();

    // ---- Fetch + Verify ----
    std::string hash = with_retries("Fetch of " + src.lfn, [&] {
        return fetch_to_temp(src_url, src, tmp_path);
    });

    // ---- Store + Commit ----
    CatalogEntry local;
    local.lfn     = src.lfn;
    local.pfn     = fs::absolute(final_path).string();
    local.dataset = src.dataset;
    local.block   = src.block;
    local.bytes   = src.bytes;
    local.hash    = hash;

    CommitResult res;
    try {
        res = catalog_.commit_file(local, [&] {
            file_io::rename_into_place(tmp_path, final_path.string());
        });
    } catch (const std::exception&) {
        file_io::remove_quietly(tmp_path);
        throw;
    }
    file_io::remove_quietly(tmp_path);

    if (res == CommitResult::CONFLICT) {
        throw PermanentError(src.lfn + " in " + src.block +
                             " was cataloged with another hash during the transfer");
    }
    if (res == CommitResult::PRESENT) {
        LOG_INFO("Already have " + src.lfn + " with hash " + src.hash);
    } else {
        LOG_INFO("Stored " + src.lfn + " (" + utils::format_bytes((u64)src.bytes) + ") at " + local.pfn);
    }
    return local;
}

std::string TransferExecutor::fetch_to_temp(const std::string& src_url, const CatalogEntry& src,
                                            const std::string& tmp_path)
{
    try {
        file_io::MmapWriter writer;
        writer.open(tmp_path, (u64)src.bytes);
        hash::Sha256 sha;

        u64 offset = 0;
        for (;;) {
            std::string frame = remote_.fetch_chunk(src_url, src, offset, TRANSFER_CHUNK_SIZE);
            proto::Chunk chunk = proto::decode_chunk(frame);
            if (chunk.offset != offset) {
                throw TransientError("Chunk for offset " + std::to_string(chunk.offset) +
                                     " received, expected " + std::to_string(offset));
            }
            if (offset + chunk.data.size() > (u64)src.bytes) {
                throw TransientError("Source sent more than the " + std::to_string(src.bytes) +
                                     " cataloged bytes of " + src.lfn);
            }
            writer.write_at(offset, chunk.data.data(), chunk.data.size());
            sha.update(chunk.data.data(), chunk.data.size());
            offset += chunk.data.size();

            if (chunk.last) break;
            if (chunk.data.empty()) {
                throw TransientError("Empty non-final chunk at offset " + std::to_string(offset));
            }
        }
        writer.close();

        if (offset != (u64)src.bytes) {
            throw TransientError("Short transfer of " + src.lfn + ": " + std::to_string(offset) +
                                 " of " + std::to_string(src.bytes) + " bytes");
        }
        std::string got = sha.hex_digest();
        if (!hash::same_hash(src.hash, got)) {
            throw TransientError("Hash mismatch for " + src.lfn + ": expected " + src.hash +
                                 ", got " + got);
        }
        return got;
    } catch (const std::exception&) {
        file_io::remove_quietly(tmp_path);
        throw;
    }
}
