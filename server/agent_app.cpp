// ============================================================
// agent_app.cpp -- meshcp agent daemon implementation
// ============================================================

#include "agent_app.hpp"
#include "metrics_sink.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <thread>
#include <chrono>

AgentApp::AgentApp(AgentConfig config)
    : config_(std::move(config))
{
    LOG_INFO("Agent " + config_.to_string());

    catalog_ = std::make_unique<Catalog>(CatalogConfig::load(config_.catalog));

    AgentInfo self;
    self.agent = config_.url;
    self.alias = config_.name;
    transport_ = std::make_unique<HttpMeshTransport>(config_.timeout_ms);
    mesh_      = std::make_unique<AgentMesh>(self, *transport_);
    remote_    = std::make_unique<HttpRemoteAgent>(config_.timeout_ms);

    ExecutorConfig ecfg;
    ecfg.storage               = config_.storage;
    ecfg.retry.attempts        = config_.attempts;
    ecfg.retry.backoff_init_ms = config_.backoff_init_ms;
    ecfg.retry.backoff_max_ms  = config_.backoff_max_ms;
    executor_ = std::make_unique<TransferExecutor>(ecfg, *catalog_, *mesh_, *remote_);

    DispatcherConfig dcfg;
    dcfg.workers            = config_.workers;
    dcfg.queue_size         = config_.queue_size;
    dcfg.metrics_interval_s = config_.minterval;
    TransferExecutor* exec = executor_.get();
    dispatcher_ = std::make_unique<Dispatcher>(
        dcfg,
        [exec](u64 id, const TransferRequest& req) { return exec->run(id, req); },
        make_metrics_sink(config_.mfile));

    uploads_ = std::make_unique<UploadReceiver>(config_.storage, *catalog_, 600000,
                                                config_.max_upload_bytes);

    AgentProtocol proto;
    proto.protocol  = config_.protocol;
    proto.backend   = config_.backend;
    proto.tool      = config_.tool;
    proto.tool_opts = config_.tool_opts;
    handlers_ = std::make_unique<AgentHandlers>(utils::parse_url(config_.url).base,
                                                *catalog_, *mesh_, *dispatcher_, *uploads_,
                                                proto, config_.timeout_ms);

    AgentHandlers* h = handlers_.get();
    server_ = std::make_unique<HttpServer>(config_.listen_ip, config_.port,
                                           [h](const HttpRequest& req) { return h->handle(req); });
}

AgentApp::~AgentApp() {
    shutdown();
}

int AgentApp::run() {
    server_->listen();

    mesh_->register_self();
    mesh_->join(config_.register_url);

    server_->start();

    LOG_INFO("meshcp agent " + config_.name + " serving " + config_.url);

    while (!stop_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    shutdown();
    return 0;
}

void AgentApp::stop() {
    stop_requested_.store(true);
}

void AgentApp::shutdown() {
    if (server_) server_->stop();
    if (dispatcher_) dispatcher_->shutdown();
}
