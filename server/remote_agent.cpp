// ============================================================
// remote_agent.cpp
// ============================================================

#include "remote_agent.hpp"
#include "../common/http_client.hpp"
#include "../common/json_codec.hpp"
#include "../common/utils.hpp"

std::vector<CatalogEntry> HttpRemoteAgent::records(const std::string& agent_url,
                                                   const TransferRequest& filter)
{
    utils::QueryParams q{{"dataset", filter.dataset},
                         {"block",   filter.block},
                         {"lfn",     filter.file}};
    std::string url = utils::join_url(agent_url, "/tfc") + utils::build_query(q);

    HttpResponse res = http_client::expect_ok("GET", url, "", "", timeout_ms_);
    try {
        Json::Value v = json_codec::parse(res.body);
        if (v.isNull()) return {};
        return json_codec::entries_from_json(v);
    } catch (const std::invalid_argument& e) {
        // Garbled body from a 2xx reply
        throw HttpError("Bad catalog reply from " + agent_url + ": " + e.what(), 502);
    }
}

std::string HttpRemoteAgent::fetch_chunk(const std::string& agent_url,
                                         const CatalogEntry& entry,
                                         u64 offset, u32 length)
{
    utils::QueryParams q{{"lfn",     entry.lfn},
                         {"dataset", entry.dataset},
                         {"block",   entry.block},
                         {"offset",  std::to_string(offset)},
                         {"length",  std::to_string(length)}};
    std::string url = utils::join_url(agent_url, "/fetch") + utils::build_query(q);
    return http_client::expect_ok("GET", url, "", "", timeout_ms_).body;
}
