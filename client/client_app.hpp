#pragma once

// ============================================================
// client_app.hpp -- meshcp command line client
//   Talks to one agent over HTTP; retries while the agent is
//   unreachable or busy.
// ============================================================

#include "../common/platform.hpp"
#include "../common/records.hpp"
#include "../common/http_client.hpp"
#include <string>
#include <atomic>

struct ClientOptions {
    std::string   agent;          // agent base URL
    std::string   command;        // status, agents, files, tfc, dump, request, add, upload, protocol
    std::string   dataset;
    std::string   block;
    std::string   lfn;
    std::string   src_alias;
    std::string   dst_alias;
    std::string   path;           // local file for add/upload
    std::string   job;            // status --job
    AgentProtocol protocol;
    int           timeout_ms{http_client::DEFAULT_TIMEOUT_MS};
    int           retry_secs{30};
};

class ClientApp {
public:
    explicit ClientApp(ClientOptions opts);

    // Run the command; 0 on success, 1 when the agent refused it
    int run();

    // Signal stop from a signal handler
    void stop();

private:
    ClientOptions     opts_;
    std::atomic<bool> stop_{false};

    int cmd_status();
    int cmd_query(const std::string& endpoint);
    int cmd_request();
    int cmd_add();
    int cmd_upload();
    int cmd_protocol();

    // Issue one call, retrying with back-off while the agent is
    // unreachable (no response) or busy (503), up to retry_secs.
    HttpResponse call_with_retry(const std::string& method,
                                 const std::string& url,
                                 const std::string& body,
                                 const std::string& content_type);

    // Upload one pass over the file; false when the agent rejected a chunk
    bool upload_once(const std::string& base_url, u64 size, const std::string& hash);

    std::string url(const std::string& endpoint) const;

    // Print body, pretty-printing JSON; returns exit code for status
    int print_response(const HttpResponse& res) const;
};
