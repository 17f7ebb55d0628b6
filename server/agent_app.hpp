#pragma once

// ============================================================
// agent_app.hpp -- meshcp agent daemon
//
// Startup order:
//   open catalog -> start dispatcher -> bind listener -> register self
//   -> join mesh through the bootstrap peer (if any) -> accept
// Shutdown order:
//   stop listening -> drain dispatcher
// ============================================================

#include "agent_config.hpp"
#include "catalog.hpp"
#include "mesh.hpp"
#include "remote_agent.hpp"
#include "transfer_executor.hpp"
#include "dispatcher.hpp"
#include "upload_receiver.hpp"
#include "handlers.hpp"
#include "http_server.hpp"
#include <memory>
#include <atomic>

class AgentApp {
public:
    // Opens the catalog and sets up all components; throws CatalogError
    // or ConfigError
    explicit AgentApp(AgentConfig config);
    ~AgentApp();

    // Blocks until stop() is called. Throws MeshError if joining fails;
    // no connection is accepted before the join succeeded.
    int run();

    // Listen port, once run() has bound it
    u16 port() const { return server_->port(); }

    // Safe to call from a signal handler
    void stop();

private:
    AgentConfig       config_;
    std::atomic<bool> stop_requested_{false};

    std::unique_ptr<Catalog>          catalog_;
    std::unique_ptr<HttpMeshTransport> transport_;
    std::unique_ptr<AgentMesh>        mesh_;
    std::unique_ptr<HttpRemoteAgent>  remote_;
    std::unique_ptr<TransferExecutor> executor_;
    std::unique_ptr<Dispatcher>       dispatcher_;
    std::unique_ptr<UploadReceiver>   uploads_;
    std::unique_ptr<AgentHandlers>    handlers_;
    std::unique_ptr<HttpServer>       server_;

    void shutdown();
};
