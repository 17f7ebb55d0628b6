// ============================================================
// mesh.cpp
// ============================================================

#include "mesh.hpp"
#include "../common/http_client.hpp"
#include "../common/json_codec.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

// ============================================================
// HttpMeshTransport
// ============================================================

void HttpMeshTransport::announce(const std::string& peer_url, const AgentInfo& self) {
    http_client::expect_ok("POST", utils::join_url(peer_url, "/register"),
                           json_codec::write(json_codec::to_json(self)),
                           "application/json", timeout_ms_);
}

AgentTable HttpMeshTransport::fetch_agents(const std::string& peer_url) {
    HttpResponse res = http_client::expect_ok("GET", utils::join_url(peer_url, "/agents"),
                                              "", "", timeout_ms_);
    try {
        return json_codec::table_from_json(json_codec::parse(res.body));
    } catch (const std::invalid_argument& e) {
        throw HttpError("Bad agent table from " + peer_url + ": " + e.what(), res.status);
    }
}

// ============================================================
// AgentMesh
// ============================================================

static std::string strip_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

AgentMesh::AgentMesh(AgentInfo self, MeshTransport& transport)
    : self_(std::move(self)), transport_(transport)
{
    self_.agent = strip_slash(self_.agent);
}

void AgentMesh::register_self() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (agents_.count(self_.alias)) {
        throw MeshError("Agent alias '" + self_.alias + "' is already registered as " +
                        agents_[self_.alias]);
    }
    agents_[self_.alias] = self_.agent;
    LOG_INFO("Registered self as " + self_.alias + " -> " + self_.agent);
}

void AgentMesh::join(const std::string& bootstrap_url) {
    if (bootstrap_url.empty()) return;
    std::string boot = strip_slash(bootstrap_url);

    try {
        transport_.announce(boot, self_);
    } catch (const std::exception& e) {
        throw MeshError("Unable to register at " + boot + ": " + e.what());
    }

    AgentTable remote;
    try {
        remote = transport_.fetch_agents(boot);
    } catch (const std::exception& e) {
        LOG_WARN("Unable to get agent list from " + boot + ": " + e.what());
    }

    // Local entries win: only unknown aliases are taken over
    AgentTable peers;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto& [alias, url] : remote) {
            if (!agents_.count(alias)) {
                agents_[alias] = strip_slash(url);
                LOG_INFO("Learned agent " + alias + " -> " + url + " from " + boot);
            }
        }
        peers = agents_;
    }

    for (auto& [alias, url] : peers) {
        if (alias == self_.alias || url == boot || url == self_.agent) continue;
        try {
            transport_.announce(url, self_);
            LOG_DEBUG("Announced self to " + alias + " (" + url + ")");
        } catch (const std::exception& e) {
            LOG_WARN("Unable to announce self to " + alias + " (" + url + "): " + e.what());
        }
    }
    LOG_INFO("Joined mesh via " + boot + ", " + std::to_string(peers.size()) + " agents known");
}

bool AgentMesh::lookup(const std::string& alias, std::string& url) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = agents_.find(alias);
    if (it == agents_.end()) return false;
    url = it->second;
    return true;
}

UpsertResult AgentMesh::upsert(const AgentInfo& info) {
    if (info.alias.empty() || info.agent.empty()) {
        throw std::invalid_argument("Registration needs both Agent and Alias");
    }
    std::string url = strip_slash(info.agent);

    if (info.alias == self_.alias && url != self_.agent) {
        throw MeshError("Alias '" + info.alias + "' belongs to this agent (" + self_.agent + ")");
    }

    std::lock_guard<std::mutex> lk(mutex_);
    auto it = agents_.find(info.alias);
    if (it == agents_.end()) {
        agents_[info.alias] = url;
        LOG_INFO("Agent " + info.alias + " registered at " + url);
        return UpsertResult::ADDED;
    }
    if (it->second == url) {
        return UpsertResult::UNCHANGED;
    }
    LOG_WARN("Agent " + info.alias + " moved from " + it->second + " to " + url);
    it->second = url;
    return UpsertResult::UPDATED;
}

AgentTable AgentMesh::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return agents_;
}
