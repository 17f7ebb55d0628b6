#pragma once

// ============================================================
// agent_config.hpp -- Agent settings: JSON file + command line
// ============================================================

#include "../common/platform.hpp"
#include <string>

struct AgentConfig {
    std::string name;              // alias, unique across the mesh
    std::string url;               // public base URL, e.g. http://host:8989/meshcp
    u16         port{8989};        // listen port
    std::string listen_ip{"0.0.0.0"};
    std::string catalog;           // catalog JSON file {type, uri, ...}
    std::string storage;           // root directory for received files
    std::string register_url;      // bootstrap peer, empty = singleton mesh

    std::string protocol;          // backend transfer tool, shown in /status
    std::string backend;
    std::string tool;
    std::string tool_opts;

    std::string mfile;             // metrics file, empty = log
    int         minterval{600};    // metrics interval, seconds
    int         workers{4};
    int         queue_size{100};
    int         attempts{3};
    u32         backoff_init_ms{500};
    u32         backoff_max_ms{8000};
    int         timeout_ms{10000}; // per network call
    u64         max_upload_bytes{100ull * 1024 * 1024 * 1024};
    std::string logfile;
    std::string transfer_log;      // failed jobs, default transfer_errors.log

    // Overlay keys present in the JSON file onto this config.
    // Throws ConfigError on unreadable file, bad JSON or wrong types.
    void load_file(const std::string& path);

    // Fill defaults that depend on the host (alias, storage) and check
    // ranges; throws ConfigError.
    void finalize();

    std::string to_string() const;
};
