#pragma once

// ============================================================
// handlers.hpp -- Agent HTTP routes
//
//   GET  /status   /agents   /files   /tfc   /dump   /fetch
//   POST /register /tfc      /request /upload /protocol
//
// All routes live under the base path of the agent URL.
// ============================================================

#include "../common/records.hpp"
#include "http_server.hpp"
#include "catalog.hpp"
#include "mesh.hpp"
#include "dispatcher.hpp"
#include "upload_receiver.hpp"
#include <string>
#include <mutex>

class AgentHandlers {
public:
    AgentHandlers(std::string base_path,
                  Catalog& catalog,
                  AgentMesh& mesh,
                  Dispatcher& dispatcher,
                  UploadReceiver& uploads,
                  AgentProtocol protocol,
                  int timeout_ms);

    HttpReply handle(const HttpRequest& req);

    AgentProtocol protocol() const;

private:
    std::string     base_;
    Catalog&        catalog_;
    AgentMesh&      mesh_;
    Dispatcher&     dispatcher_;
    UploadReceiver& uploads_;
    int             timeout_ms_;

    mutable std::mutex protocol_mutex_;
    AgentProtocol      protocol_;

    HttpReply on_status(const HttpRequest& req);
    HttpReply on_agents(const HttpRequest& req);
    HttpReply on_register(const HttpRequest& req);
    HttpReply on_files(const HttpRequest& req);
    HttpReply on_tfc_get(const HttpRequest& req);
    HttpReply on_tfc_post(const HttpRequest& req);
    HttpReply on_dump(const HttpRequest& req);
    HttpReply on_request(const HttpRequest& req);
    HttpReply on_fetch(const HttpRequest& req);
    HttpReply on_upload(const HttpRequest& req);
    HttpReply on_protocol(const HttpRequest& req);
};
