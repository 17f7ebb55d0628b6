// ============================================================
// json_codec.cpp
// ============================================================

#include "json_codec.hpp"
#include <memory>

namespace json_codec {

namespace {

std::string get_string(const Json::Value& v, const char* key) {
    if (!v.isMember(key) || v[key].isNull()) return "";
    if (!v[key].isString()) {
        throw std::invalid_argument(std::string("field '") + key + "' must be a string");
    }
    return v[key].asString();
}

i64 get_int64(const Json::Value& v, const char* key) {
    if (!v.isMember(key) || v[key].isNull()) return 0;
    if (!v[key].isIntegral()) {
        throw std::invalid_argument(std::string("field '") + key + "' must be an integer");
    }
    return (i64)v[key].asInt64();
}

void require_object(const Json::Value& v, const char* what) {
    if (!v.isObject()) {
        throw std::invalid_argument(std::string(what) + " must be a JSON object");
    }
}

} // namespace

Json::Value parse(const std::string& text) {
    Json::Value root;
    std::string errs;
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> const reader(builder.newCharReader());
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        throw std::invalid_argument("malformed JSON: " + errs);
    }
    return root;
}

std::string write(const Json::Value& v, const char* indent) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = indent;
    return Json::writeString(writer, v);
}

Json::Value to_json(const CatalogEntry& e) {
    Json::Value v(Json::objectValue);
    v["lfn"]     = e.lfn;
    v["pfn"]     = e.pfn;
    v["dataset"] = e.dataset;
    v["block"]   = e.block;
    v["bytes"]   = (Json::Int64)e.bytes;
    v["hash"]    = e.hash;
    return v;
}

Json::Value to_json(const TransferRequest& r) {
    Json::Value v(Json::objectValue);
    v["dataset"] = r.dataset;
    v["block"]   = r.block;
    v["file"]    = r.file;
    if (!r.src_alias.empty()) v["src_alias"] = r.src_alias;
    if (!r.dst_alias.empty()) v["dst_alias"] = r.dst_alias;
    return v;
}

// Registration bodies keep the original capitalized field names
Json::Value to_json(const AgentInfo& a) {
    Json::Value v(Json::objectValue);
    v["Agent"] = a.agent;
    v["Alias"] = a.alias;
    return v;
}

Json::Value to_json(const AgentProtocol& p) {
    Json::Value v(Json::objectValue);
    v["protocol"] = p.protocol;
    v["backend"]  = p.backend;
    v["tool"]     = p.tool;
    v["toolopts"] = p.tool_opts;
    return v;
}

Json::Value to_json(const AgentTable& t) {
    Json::Value v(Json::objectValue);
    for (auto& [alias, url] : t) {
        v[alias] = url;
    }
    return v;
}

Json::Value to_json(const std::vector<CatalogEntry>& entries) {
    Json::Value v(Json::arrayValue);
    for (auto& e : entries) v.append(to_json(e));
    return v;
}

CatalogEntry entry_from_json(const Json::Value& v) {
    require_object(v, "catalog entry");
    CatalogEntry e;
    e.lfn     = get_string(v, "lfn");
    e.pfn     = get_string(v, "pfn");
    e.dataset = get_string(v, "dataset");
    e.block   = get_string(v, "block");
    e.bytes   = get_int64(v, "bytes");
    e.hash    = get_string(v, "hash");
    return e;
}

TransferRequest request_from_json(const Json::Value& v) {
    require_object(v, "transfer request");
    TransferRequest r;
    r.dataset   = get_string(v, "dataset");
    r.block     = get_string(v, "block");
    r.file      = get_string(v, "file");
    r.src_alias = get_string(v, "src_alias");
    r.dst_alias = get_string(v, "dst_alias");
    return r;
}

AgentInfo agent_from_json(const Json::Value& v) {
    require_object(v, "agent info");
    AgentInfo a;
    a.agent = get_string(v, "Agent");
    a.alias = get_string(v, "Alias");
    return a;
}

AgentProtocol protocol_from_json(const Json::Value& v) {
    require_object(v, "agent protocol");
    AgentProtocol p;
    p.protocol  = get_string(v, "protocol");
    p.backend   = get_string(v, "backend");
    p.tool      = get_string(v, "tool");
    p.tool_opts = get_string(v, "toolopts");
    return p;
}

AgentTable table_from_json(const Json::Value& v) {
    require_object(v, "agent table");
    AgentTable t;
    for (auto& alias : v.getMemberNames()) {
        if (!v[alias].isString()) {
            throw std::invalid_argument("agent table value for '" + alias + "' must be a string");
        }
        t[alias] = v[alias].asString();
    }
    return t;
}

std::vector<CatalogEntry> entries_from_json(const Json::Value& v) {
    std::vector<CatalogEntry> out;
    if (v.isArray()) {
        for (auto& item : v) out.push_back(entry_from_json(item));
    } else {
        out.push_back(entry_from_json(v));
    }
    return out;
}

} // namespace json_codec
