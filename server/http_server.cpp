// ============================================================
// http_server.cpp -- Boost.Beast implementation of HttpServer
// ============================================================

#include "http_server.hpp"
#include "../common/logger.hpp"
#include <chrono>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

// Upload bodies carry at most one chunk frame; catalog posts stay small
static constexpr u64 MAX_REQUEST_BODY = 64ull * 1024 * 1024;

HttpServer::HttpServer(std::string address, u16 port, RequestHandler handler, int idle_timeout_ms)
    : address_(std::move(address)),
      port_(port),
      handler_(std::move(handler)),
      idle_timeout_ms_(idle_timeout_ms),
      acceptor_(ioc_)
{}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::listen() {
    if (acceptor_.is_open()) return;
    tcp::endpoint ep(net::ip::make_address(address_), port_);
    acceptor_.open(ep.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(ep);
    acceptor_.listen(net::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();
    LOG_DEBUG("HTTP server bound to " + address_ + ":" + std::to_string(bound_port_));
}

void HttpServer::start() {
    if (running_.load()) return;
    listen();

    running_.store(true);
    do_accept();
    accept_thread_ = std::thread([this] { ioc_.run(); });

    LOG_INFO("HTTP server listening on " + address_ + ":" + std::to_string(bound_port_));
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        // Bound but never started: drop the backlog
        beast::error_code ec;
        if (acceptor_.is_open()) acceptor_.close(ec);
        return;
    }

    // The pending accept completes with operation_aborted and is not renewed
    net::post(ioc_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
    });
    if (accept_thread_.joinable()) accept_thread_.join();

    while (open_connections_.load() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    cleanup_threads();
    LOG_INFO("HTTP server stopped");
}

// ---------------------------------------------------------------
// do_accept
//   Each accepted socket gets its own io_context so the connection
//   thread can run deadlines on it without touching the acceptor.
// ---------------------------------------------------------------
void HttpServer::do_accept() {
    auto conn_ioc = std::make_shared<net::io_context>(1);
    acceptor_.async_accept(conn_ioc->get_executor(),
        [this, conn_ioc](beast::error_code ec, tcp::socket sock) {
            if (!running_.load()) return;
            if (ec) {
                LOG_ERROR("accept: " + ec.message());
            } else {
                ++open_connections_;
                std::lock_guard<std::mutex> lk(connection_mutex_);
                connection_threads_.emplace_back(
                    [this, conn_ioc, s = std::move(sock)]() mutable {
                        connection_thread(conn_ioc, std::move(s));
                    });
            }
            cleanup_threads();
            do_accept();
        });
}

void HttpServer::connection_thread(std::shared_ptr<net::io_context> ioc, tcp::socket sock) {
    std::string peer = "?";
    {
        beast::error_code ec;
        auto ep = sock.remote_endpoint(ec);
        if (!ec) peer = ep.address().to_string() + ":" + std::to_string(ep.port());
    }
    LOG_DEBUG("Accepted connection from " + peer);

    beast::tcp_stream stream(std::move(sock));
    beast::flat_buffer buffer;

    // Run one async operation to completion on this thread
    auto run_op = [&ioc]() {
        ioc->restart();
        ioc->run();
    };

    try {
        for (;;) {
            http::request_parser<http::string_body> parser;
            parser.body_limit(MAX_REQUEST_BODY);

            beast::error_code ec;
            stream.expires_after(std::chrono::milliseconds(idle_timeout_ms_));
            http::async_read(stream, buffer, parser,
                             [&ec](beast::error_code e, std::size_t) { ec = e; });
            run_op();
            if (ec == http::error::end_of_stream || ec == beast::error::timeout) break;
            if (ec) {
                LOG_DEBUG("read from " + peer + ": " + ec.message());
                break;
            }

            auto& req = parser.get();
            std::string target(req.target());
            auto qpos = target.find('?');

            HttpRequest r;
            r.method = std::string(req.method_string());
            r.path   = utils::url_decode(target.substr(0, qpos));
            if (qpos != std::string::npos) r.query = utils::parse_query(target.substr(qpos + 1));
            r.body   = std::move(req.body());
            r.peer   = peer;

            HttpReply reply = dispatch(r);

            http::response<http::string_body> res{static_cast<http::status>(reply.status),
                                                  req.version()};
            res.set(http::field::server, "meshcp-agent");
            res.set(http::field::content_type, reply.content_type);
            res.keep_alive(req.keep_alive() && running_.load());
            res.body() = std::move(reply.body);
            res.prepare_payload();

            stream.expires_after(std::chrono::milliseconds(idle_timeout_ms_));
            http::async_write(stream, res,
                              [&ec](beast::error_code e, std::size_t) { ec = e; });
            run_op();
            if (ec) {
                LOG_DEBUG("write to " + peer + ": " + ec.message());
                break;
            }
            if (!res.keep_alive()) break;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("connection_thread (" + peer + "): " + e.what());
    }

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    --open_connections_;
}

HttpReply HttpServer::dispatch(const HttpRequest& req) {
    try {
        HttpReply reply = handler_(req);
        LOG_DEBUG(req.method + " " + req.path + " from " + req.peer + " -> " +
                  std::to_string(reply.status));
        return reply;
    } catch (const std::exception& e) {
        LOG_ERROR(req.method + " " + req.path + " failed: " + e.what());
        HttpReply reply;
        reply.status = 500;
        reply.body   = "{\"status\":\"error\"}";
        return reply;
    }
}

void HttpServer::cleanup_threads() {
    std::lock_guard<std::mutex> lk(connection_mutex_);
    for (auto& t : connection_threads_) {
        if (t.joinable()) t.detach();
    }
    connection_threads_.clear();
}
