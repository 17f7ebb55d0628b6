#pragma once

// ============================================================
// mesh.hpp -- Agent membership table and registration protocol
//
// Join through a bootstrap peer B:
//   1. POST self to B/register      (failure aborts startup)
//   2. GET  B/agents, merge aliases not known locally (best effort)
//   3. POST self to every other known peer (best effort)
// After one join every existing member knows the newcomer and the
// newcomer knows every member B knew about.
// ============================================================

#include "../common/records.hpp"
#include <string>
#include <mutex>
#include <stdexcept>

// Startup-fatal membership failure
class MeshError : public std::runtime_error {
public:
    explicit MeshError(const std::string& msg) : std::runtime_error(msg) {}
};

// Network side of the protocol. Implementations throw HttpError.
class MeshTransport {
public:
    virtual ~MeshTransport() = default;

    // POST {Agent, Alias} to peer_url/register
    virtual void announce(const std::string& peer_url, const AgentInfo& self) = 0;

    // GET peer_url/agents
    virtual AgentTable fetch_agents(const std::string& peer_url) = 0;
};

class HttpMeshTransport : public MeshTransport {
public:
    explicit HttpMeshTransport(int timeout_ms) : timeout_ms_(timeout_ms) {}

    void announce(const std::string& peer_url, const AgentInfo& self) override;
    AgentTable fetch_agents(const std::string& peer_url) override;

private:
    int timeout_ms_;
};

enum class UpsertResult {
    ADDED,
    UNCHANGED,
    UPDATED,
};

class AgentMesh {
public:
    AgentMesh(AgentInfo self, MeshTransport& transport);

    AgentMesh(const AgentMesh&) = delete;
    AgentMesh& operator=(const AgentMesh&) = delete;

    // Insert self; throws MeshError if the alias is already present
    void register_self();

    // Join through bootstrap_url (no-op when empty). Throws MeshError
    // if registration at the bootstrap peer fails.
    void join(const std::string& bootstrap_url);

    bool lookup(const std::string& alias, std::string& url) const;

    // Inbound registration: same URL is a no-op, a new URL replaces the
    // old one. Throws std::invalid_argument on an empty alias or URL and
    // MeshError when another URL claims this agent's own alias.
    UpsertResult upsert(const AgentInfo& info);

    AgentTable snapshot() const;

    const AgentInfo& self() const { return self_; }

private:
    AgentInfo          self_;
    MeshTransport&     transport_;
    mutable std::mutex mutex_;
    AgentTable         agents_;
};
