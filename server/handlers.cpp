// ============================================================
// handlers.cpp
// ============================================================

#include "handlers.hpp"
#include "../common/json_codec.hpp"
#include "../common/http_client.hpp"
#include "../common/protocol_io.hpp"
#include "../common/file_io.hpp"
#include "../common/compress.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <stdexcept>

// Jobs listed by GET /status
static constexpr size_t STATUS_JOBS = 20;

namespace {

HttpReply json_reply(int status, const Json::Value& v) {
    HttpReply r;
    r.status = status;
    r.body   = json_codec::write(v);
    return r;
}

HttpReply status_reply(int status, const std::string& word) {
    Json::Value v(Json::objectValue);
    v["status"] = word;
    return json_reply(status, v);
}

HttpReply error_reply(int status, const std::string& msg) {
    Json::Value v(Json::objectValue);
    v["status"] = "error";
    v["error"]  = msg;
    return json_reply(status, v);
}

std::string param(const utils::QueryParams& q, const std::string& key) {
    auto it = q.find(key);
    return it == q.end() ? "" : it->second;
}

u64 param_u64(const utils::QueryParams& q, const std::string& key, u64 def) {
    std::string v = param(q, key);
    if (v.empty()) return def;
    if (v.find_first_not_of("0123456789") != std::string::npos || v.size() > 19) {
        throw std::invalid_argument("parameter '" + key + "' must be a non-negative integer");
    }
    return std::stoull(v);
}

TransferRequest filter_from_query(const utils::QueryParams& q) {
    TransferRequest f;
    f.dataset = param(q, "dataset");
    f.block   = param(q, "block");
    f.file    = param(q, "lfn");
    return f;
}

Json::Value job_to_json(const JobRecord& j) {
    Json::Value v(Json::objectValue);
    v["id"]        = (Json::UInt64)j.id;
    v["state"]     = job_state_name(j.state);
    v["request"]   = json_codec::to_json(j.request);
    v["files"]     = (Json::UInt64)j.files_done;
    v["bytes"]     = (Json::UInt64)j.bytes_done;
    v["submitted"] = (Json::UInt64)j.submitted_ms;
    v["started"]   = (Json::UInt64)j.started_ms;
    v["finished"]  = (Json::UInt64)j.finished_ms;
    if (!j.error.empty()) v["error"] = j.error;
    return v;
}

} // namespace

AgentHandlers::AgentHandlers(std::string base_path,
                             Catalog& catalog,
                             AgentMesh& mesh,
                             Dispatcher& dispatcher,
                             UploadReceiver& uploads,
                             AgentProtocol protocol,
                             int timeout_ms)
    : base_(std::move(base_path)),
      catalog_(catalog),
      mesh_(mesh),
      dispatcher_(dispatcher),
      uploads_(uploads),
      timeout_ms_(timeout_ms),
      protocol_(std::move(protocol))
{
    while (!base_.empty() && base_.back() == '/') base_.pop_back();
}

AgentProtocol AgentHandlers::protocol() const {
    std::lock_guard<std::mutex> lk(protocol_mutex_);
    return protocol_;
}

HttpReply AgentHandlers::handle(const HttpRequest& req) {
    if (req.path.compare(0, base_.size(), base_) != 0) {
        return error_reply(404, "not found: " + req.path);
    }
    std::string route = req.path.substr(base_.size());
    bool get  = req.method == "GET";
    bool post = req.method == "POST";

    if (route == "/status"   && get)  return on_status(req);
    if (route == "/agents"   && get)  return on_agents(req);
    if (route == "/register" && post) return on_register(req);
    if (route == "/files"    && get)  return on_files(req);
    if (route == "/tfc"      && get)  return on_tfc_get(req);
    if (route == "/tfc"      && post) return on_tfc_post(req);
    if (route == "/dump"     && get)  return on_dump(req);
    if (route == "/request"  && post) return on_request(req);
    if (route == "/fetch"    && get)  return on_fetch(req);
    if (route == "/upload"   && post) return on_upload(req);
    if (route == "/protocol" && post) return on_protocol(req);

    static const char* const routes[] = {
        "/status", "/agents", "/register", "/files", "/tfc", "/dump",
        "/request", "/fetch", "/upload", "/protocol", nullptr
    };
    for (int i = 0; routes[i]; ++i) {
        if (route == routes[i]) return error_reply(405, req.method + " not allowed on " + route);
    }
    return error_reply(404, "not found: " + req.path);
}

HttpReply AgentHandlers::on_status(const HttpRequest& req) {
    if (req.query.count("job")) {
        u64 id;
        try {
            id = param_u64(req.query, "job", 0);
        } catch (const std::invalid_argument& e) {
            return error_reply(400, e.what());
        }
        JobRecord rec;
        if (!dispatcher_.job(id, rec)) return error_reply(404, "unknown job " + std::to_string(id));
        return json_reply(200, job_to_json(rec));
    }

    DispatcherSnapshot snap = dispatcher_.snapshot();
    Json::Value disp = json_codec::parse(snap.to_json());

    Json::Value v(Json::objectValue);
    v["alias"]      = mesh_.self().alias;
    v["url"]        = mesh_.self().agent;
    v["catalog"]    = catalog_.type();
    v["protocol"]   = json_codec::to_json(protocol());
    v["agents"]     = (Json::UInt64)mesh_.snapshot().size();
    v["uploads"]    = (Json::UInt64)uploads_.active_uploads();
    v["dispatcher"] = disp;
    Json::Value jobs(Json::arrayValue);
    for (auto& j : dispatcher_.recent_jobs(STATUS_JOBS)) jobs.append(job_to_json(j));
    v["jobs"] = jobs;
    return json_reply(200, v);
}

HttpReply AgentHandlers::on_agents(const HttpRequest&) {
    return json_reply(200, json_codec::to_json(mesh_.snapshot()));
}

HttpReply AgentHandlers::on_register(const HttpRequest& req) {
    AgentInfo info;
    try {
        info = json_codec::agent_from_json(json_codec::parse(req.body));
    } catch (const std::invalid_argument& e) {
        return error_reply(400, e.what());
    }

    UpsertResult res;
    try {
        res = mesh_.upsert(info);
    } catch (const std::invalid_argument& e) {
        return error_reply(400, e.what());
    } catch (const MeshError& e) {
        return error_reply(409, e.what());
    }

    Json::Value v(Json::objectValue);
    v["status"] = "ok";
    v["result"] = res == UpsertResult::ADDED ? "added"
                : res == UpsertResult::UPDATED ? "updated" : "unchanged";
    return json_reply(200, v);
}

HttpReply AgentHandlers::on_files(const HttpRequest& req) {
    std::vector<CatalogEntry> entries;
    if (!catalog_.query(filter_from_query(req.query), entries)) {
        return error_reply(500, "catalog query failed");
    }
    Json::Value v(Json::arrayValue);
    for (auto& e : entries) v.append(e.lfn);
    return json_reply(200, v);
}

HttpReply AgentHandlers::on_tfc_get(const HttpRequest& req) {
    std::vector<CatalogEntry> entries;
    if (!catalog_.query(filter_from_query(req.query), entries)) {
        return error_reply(500, "catalog query failed");
    }
    return json_reply(200, json_codec::to_json(entries));
}

HttpReply AgentHandlers::on_tfc_post(const HttpRequest& req) {
    std::vector<CatalogEntry> entries;
    try {
        entries = json_codec::entries_from_json(json_codec::parse(req.body));
    } catch (const std::invalid_argument& e) {
        return error_reply(400, e.what());
    }

    size_t added = 0;
    for (auto& e : entries) {
        try {
            catalog_.add(e);
            ++added;
        } catch (const CatalogError& err) {
            Json::Value v(Json::objectValue);
            v["status"] = "error";
            v["error"]  = err.what();
            v["added"]  = (Json::UInt64)added;
            return json_reply(500, v);
        }
    }
    Json::Value v(Json::objectValue);
    v["status"] = "ok";
    v["added"]  = (Json::UInt64)added;
    return json_reply(200, v);
}

HttpReply AgentHandlers::on_dump(const HttpRequest&) {
    HttpReply r;
    r.content_type = "text/plain";
    r.body = catalog_.dump();
    return r;
}

HttpReply AgentHandlers::on_request(const HttpRequest& req) {
    TransferRequest tr;
    try {
        tr = json_codec::request_from_json(json_codec::parse(req.body));
    } catch (const std::invalid_argument& e) {
        return error_reply(400, e.what());
    }

    // Requests for another destination go to that agent's dispatcher
    if (!tr.dst_alias.empty() && tr.dst_alias != mesh_.self().alias) {
        std::string dst_url;
        if (!mesh_.lookup(tr.dst_alias, dst_url)) {
            return error_reply(400, "unknown destination agent " + tr.dst_alias);
        }
        try {
            HttpResponse res = http_client::post(utils::join_url(dst_url, "/request"), req.body,
                                                 "application/json", timeout_ms_);
            LOG_INFO("Forwarded " + tr.to_string() + " to " + tr.dst_alias + " -> " +
                     std::to_string(res.status));
            HttpReply r;
            r.status = res.status;
            r.body   = res.body;
            if (!res.content_type.empty()) r.content_type = res.content_type;
            return r;
        } catch (const HttpError& e) {
            return error_reply(502, e.what());
        }
    }

    if (tr.src_alias.empty()) {
        return error_reply(400, "transfer request needs src_alias");
    }

    u64 id = 0;
    if (!dispatcher_.submit(tr, &id)) {
        LOG_WARN("Dispatcher busy, rejected " + tr.to_string());
        return status_reply(503, "busy");
    }
    Json::Value v(Json::objectValue);
    v["status"] = "accepted";
    v["job"]    = (Json::UInt64)id;
    return json_reply(202, v);
}

// ---------------------------------------------------------------
// on_fetch
//   Serves one chunk frame of a cataloged file. The puller walks
//   the file front to back, TRANSFER_CHUNK_SIZE at a time.
// ---------------------------------------------------------------
HttpReply AgentHandlers::on_fetch(const HttpRequest& req) {
    TransferRequest filter = filter_from_query(req.query);
    if (filter.file.empty()) return error_reply(400, "fetch needs lfn");

    u64 offset, length;
    try {
        offset = param_u64(req.query, "offset", 0);
        length = param_u64(req.query, "length", TRANSFER_CHUNK_SIZE);
    } catch (const std::invalid_argument& e) {
        return error_reply(400, e.what());
    }
    if (length == 0 || length > TRANSFER_CHUNK_SIZE) length = TRANSFER_CHUNK_SIZE;

    std::vector<CatalogEntry> entries;
    if (!catalog_.query(filter, entries)) return error_reply(500, "catalog query failed");
    if (entries.empty()) return error_reply(404, "no catalog entry for " + filter.file);
    const CatalogEntry& e = entries.front();

    try {
        file_io::MmapReader reader(e.pfn);
        if (offset > reader.size()) {
            return error_reply(400, "offset " + std::to_string(offset) + " beyond end of " + e.lfn);
        }
        u64 len   = reader.chunk_len(offset, length);
        bool last = offset + len >= reader.size();

        HttpReply r;
        r.content_type = "application/octet-stream";
        r.body = proto::encode_chunk(offset, reader.chunk_ptr(offset), (u32)len,
                                     compress::should_compress(e.pfn), last);
        return r;
    } catch (const std::runtime_error& err) {
        LOG_ERROR("fetch " + e.lfn + " from " + e.pfn + ": " + err.what());
        return error_reply(500, err.what());
    }
}

HttpReply AgentHandlers::on_upload(const HttpRequest& req) {
    UploadMeta meta;
    meta.lfn     = param(req.query, "lfn");
    meta.dataset = param(req.query, "dataset");
    meta.block   = param(req.query, "block");
    meta.hash    = param(req.query, "hash");

    try {
        meta.bytes = (i64)param_u64(req.query, "bytes", 0);
        UploadStatus st = uploads_.on_chunk(meta, req.body);
        return status_reply(200, st == UploadStatus::COMPLETE ? "stored" : "partial");
    } catch (const std::invalid_argument& e) {
        return error_reply(400, e.what());
    } catch (const TransientError& e) {
        return error_reply(422, e.what());
    } catch (const PermanentError& e) {
        return error_reply(409, e.what());
    } catch (const StorageError& e) {
        LOG_WARN("upload " + meta.lfn + ": " + e.what());
        return error_reply(e.kind() == StorageError::TOO_LARGE ? 413 : 507, e.what());
    } catch (const CatalogError& e) {
        return error_reply(500, e.what());
    } catch (const std::runtime_error& e) {
        LOG_ERROR("upload " + meta.lfn + ": " + e.what());
        return error_reply(507, std::string("local storage failure: ") + e.what());
    }
}

HttpReply AgentHandlers::on_protocol(const HttpRequest& req) {
    AgentProtocol p;
    try {
        p = json_codec::protocol_from_json(json_codec::parse(req.body));
    } catch (const std::invalid_argument& e) {
        return error_reply(400, e.what());
    }
    {
        std::lock_guard<std::mutex> lk(protocol_mutex_);
        protocol_ = p;
    }
    LOG_INFO("Registered protocol " + p.protocol + " backend=" + p.backend + " tool=" + p.tool);
    return status_reply(200, "ok");
}
