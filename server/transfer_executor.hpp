#pragma once

// ============================================================
// transfer_executor.hpp -- One transfer job, end to end
//
//   ResolveEndpoints  mesh lookup of the source alias, remote /tfc query
//   Fetch             GET /fetch chunk by chunk into a temp file
//   Verify            SHA-256 of the received bytes vs the source hash
//   Store + Commit    Catalog::commit_file renames the temp file to
//                     <storage>/<block dir>/<lfn> and catalogs it
//
// Fetch+Verify (and the remote catalog query) are retried with
// exponential backoff; PermanentError skips retries.
// ============================================================

#include "../common/records.hpp"
#include "../common/errors.hpp"
#include "catalog.hpp"
#include "mesh.hpp"
#include "remote_agent.hpp"
#include "dispatcher.hpp"
#include <string>
#include <random>

// Delays between attempts: the first is random in [1, init_ms], each
// following one doubles, never exceeding max_ms.
class Backoff {
public:
    Backoff(u32 init_ms, u32 max_ms);

    u32 next();

private:
    u32          init_ms_;
    u32          max_ms_;
    u32          current_{0};
    std::mt19937 rng_;
};

struct RetryPolicy {
    int attempts{3};
    u32 backoff_init_ms{500};
    u32 backoff_max_ms{8000};
};

struct ExecutorConfig {
    std::string storage;   // root directory for received files
    RetryPolicy retry;
};

class TransferExecutor {
public:
    TransferExecutor(ExecutorConfig cfg, Catalog& catalog, AgentMesh& mesh, RemoteAgent& remote);

    // Transfer every source file matching req to this agent. Throws
    // PermanentError, TransientError (attempts exhausted) or CatalogError.
    JobResult run(u64 job_id, const TransferRequest& req);

    const ExecutorConfig& config() const { return cfg_; }

private:
    ExecutorConfig cfg_;
    Catalog&       catalog_;
    AgentMesh&     mesh_;
    RemoteAgent&   remote_;

    // True when the local catalog holds this content already. Throws
    // PermanentError when it holds the name with another hash.
    bool already_present(const CatalogEntry& src);

    CatalogEntry transfer_file(u64 job_id, int n, const std::string& src_url,
                               const CatalogEntry& src);

    // Fetch + Verify into tmp_path; returns the verified hex hash
    std::string fetch_to_temp(const std::string& src_url, const CatalogEntry& src,
                              const std::string& tmp_path);

    template <typename Fn>
    auto with_retries(const std::string& what, Fn&& fn) -> decltype(fn());
};
