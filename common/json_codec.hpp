#pragma once

// ============================================================
// json_codec.hpp -- JSON form of records exchanged between agents
// ============================================================

#include "records.hpp"
#include <string>
#include <vector>
#include <stdexcept>

#include <json/json.h>

namespace json_codec {

// Parse text into a JSON document; throws std::invalid_argument on syntax errors
Json::Value parse(const std::string& text);

// Serialize compactly (indent = "") or pretty-printed
std::string write(const Json::Value& v, const char* indent = "");

Json::Value to_json(const CatalogEntry& e);
Json::Value to_json(const TransferRequest& r);
Json::Value to_json(const AgentInfo& a);
Json::Value to_json(const AgentProtocol& p);
Json::Value to_json(const AgentTable& t);
Json::Value to_json(const std::vector<CatalogEntry>& entries);

// Field readers; missing keys stay empty, wrongly typed ones throw
// std::invalid_argument
CatalogEntry    entry_from_json(const Json::Value& v);
TransferRequest request_from_json(const Json::Value& v);
AgentInfo       agent_from_json(const Json::Value& v);
AgentProtocol   protocol_from_json(const Json::Value& v);
AgentTable      table_from_json(const Json::Value& v);

// A JSON array of entries, or a single entry object
std::vector<CatalogEntry> entries_from_json(const Json::Value& v);

} // namespace json_codec
