#pragma once

// ============================================================
// remote_agent.hpp -- Calls the executor makes on a source agent
// ============================================================

#include "../common/records.hpp"
#include <string>
#include <vector>

class RemoteAgent {
public:
    virtual ~RemoteAgent() = default;

    // GET agent_url/tfc with the filter; throws HttpError
    virtual std::vector<CatalogEntry> records(const std::string& agent_url,
                                              const TransferRequest& filter) = 0;

    // GET agent_url/fetch: one encoded chunk frame of the entry's file
    // starting at offset, at most length raw bytes; throws HttpError
    virtual std::string fetch_chunk(const std::string& agent_url,
                                    const CatalogEntry& entry,
                                    u64 offset, u32 length) = 0;
};

class HttpRemoteAgent : public RemoteAgent {
public:
    explicit HttpRemoteAgent(int timeout_ms) : timeout_ms_(timeout_ms) {}

    std::vector<CatalogEntry> records(const std::string& agent_url,
                                      const TransferRequest& filter) override;

    std::string fetch_chunk(const std::string& agent_url,
                            const CatalogEntry& entry,
                            u64 offset, u32 length) override;

private:
    int timeout_ms_;
};
