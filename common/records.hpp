#pragma once

// ============================================================
// records.hpp -- Catalog and mesh record types
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <map>

// One file in the Trivial File Catalog
struct CatalogEntry {
    std::string lfn;      // logical file name
    std::string pfn;      // physical file name on this agent
    std::string dataset;  // collection of blocks
    std::string block;    // single block within a dataset
    i64         bytes{0}; // size of the physical file
    std::string hash;     // hex SHA-256 of the physical content

    std::string to_string() const {
        return "<CatalogEntry: dataset=" + dataset + " block=" + block +
               " lfn=" + lfn + " pfn=" + pfn + " bytes=" + std::to_string(bytes) +
               " hash=" + hash + ">";
    }
};

// Catalog filter and unit of dispatcher work. Empty fields are
// unconstrained; src/dst aliases are only used by the dispatcher.
struct TransferRequest {
    std::string dataset;
    std::string block;
    std::string file;
    std::string src_alias;
    std::string dst_alias;

    std::string to_string() const {
        return "<TransferRequest: dataset=" + dataset + " block=" + block +
               " file=" + file + " src=" + src_alias + " dst=" + dst_alias + ">";
    }
};

struct AgentInfo {
    std::string agent;  // base URL
    std::string alias;  // site name, unique across the mesh
};

// Backend transfer tool registered through /protocol
struct AgentProtocol {
    std::string protocol;   // e.g. srmv2
    std::string backend;    // storage end-point
    std::string tool;       // executable, e.g. /usr/bin/srmcp
    std::string tool_opts;
};

// alias -> base URL
using AgentTable = std::map<std::string, std::string>;
