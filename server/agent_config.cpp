// ============================================================
// agent_config.cpp
// ============================================================

#include "agent_config.hpp"
#include "../common/errors.hpp"
#include "../common/json_codec.hpp"
#include "../common/utils.hpp"
#include <fstream>
#include <sstream>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

void read_string(const Json::Value& v, const char* key, std::string& out) {
    if (!v.isMember(key)) return;
    if (!v[key].isString()) throw ConfigError(std::string("config key '") + key + "' must be a string");
    out = v[key].asString();
}

template <typename T>
void read_int(const Json::Value& v, const char* key, T& out) {
    if (!v.isMember(key)) return;
    if (!v[key].isIntegral()) throw ConfigError(std::string("config key '") + key + "' must be an integer");
    out = (T)v[key].asInt64();
}

} // namespace

void AgentConfig::load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw ConfigError("Unable to read config file " + path);
    std::stringstream ss;
    ss << f.rdbuf();

    Json::Value v;
    try {
        v = json_codec::parse(ss.str());
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Unable to parse config file " + path + ": " + e.what());
    }
    if (!v.isObject()) throw ConfigError("Config file " + path + " must hold a JSON object");

    int port_int = port;
    read_string(v, "name", name);
    read_string(v, "url", url);
    read_int(v, "port", port_int);
    read_string(v, "catalog", catalog);
    read_string(v, "storage", storage);
    read_string(v, "register", register_url);
    read_string(v, "protocol", protocol);
    read_string(v, "backend", backend);
    read_string(v, "tool", tool);
    read_string(v, "toolopts", tool_opts);
    read_string(v, "mfile", mfile);
    read_int(v, "minterval", minterval);
    read_int(v, "workers", workers);
    read_int(v, "queuesize", queue_size);
    read_int(v, "attempts", attempts);
    read_int(v, "backoff_init_ms", backoff_init_ms);
    read_int(v, "backoff_max_ms", backoff_max_ms);
    read_int(v, "timeout_ms", timeout_ms);
    i64 max_upload = (i64)max_upload_bytes;
    read_int(v, "max_upload_bytes", max_upload);
    if (max_upload <= 0) throw ConfigError("config key 'max_upload_bytes' must be positive");
    max_upload_bytes = (u64)max_upload;
    read_string(v, "logfile", logfile);
    read_string(v, "transfer_log", transfer_log);

    if (!utils::validate_port(port_int)) throw ConfigError("Invalid port: " + std::to_string(port_int));
    port = (u16)port_int;
}

void AgentConfig::finalize() {
    if (name.empty()) name = platform::default_site_name();
    if (url.empty()) throw ConfigError("Agent url is required (--url)");
    try {
        utils::parse_url(url);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    if (catalog.empty()) throw ConfigError("Catalog file is required (--catalog)");
    if (storage.empty()) storage = (fs::current_path() / "storage").string();
    if (!utils::validate_path(storage)) throw ConfigError("Invalid storage directory: " + storage);

    if (workers < 0 || workers > 256) throw ConfigError("workers must be 0-256");
    if (queue_size < 1 || queue_size > 1000000) throw ConfigError("queue size must be 1-1000000");
    if (minterval < 0) throw ConfigError("metrics interval must not be negative");
    if (attempts < 1 || attempts > 100) throw ConfigError("attempts must be 1-100");
    if (timeout_ms < 100) throw ConfigError("timeout_ms must be at least 100");
    if (max_upload_bytes == 0) throw ConfigError("max_upload_bytes must be positive");
    if (backoff_max_ms < backoff_init_ms) backoff_max_ms = backoff_init_ms;
}

std::string AgentConfig::to_string() const {
    return "<Config: name=" + name + " url=" + url + " port=" + std::to_string(port) +
           " catalog=" + catalog + " storage=" + storage + " protocol=" + protocol +
           " backend=" + backend + " tool=" + tool + " opts=" + tool_opts +
           " mfile=" + mfile + " minterval=" + std::to_string(minterval) +
           " workers=" + std::to_string(workers) + " queuesize=" + std::to_string(queue_size) + ">";
}
