#pragma once

// ============================================================
// http_server.hpp -- HTTP/1.1 listener for the agent
//
// Concurrency model:
//   accept thread   -> runs the acceptor, spawns one connection
//                      thread per accepted socket.
//   connection thread -> reads requests (keep-alive), calls the
//                      handler, writes replies, exits on close or
//                      idle timeout.
// ============================================================

#include "../common/platform.hpp"
#include "../common/utils.hpp"
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>
#include <functional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

struct HttpRequest {
    std::string        method;
    std::string        path;     // target without the query string
    utils::QueryParams query;
    std::string        body;
    std::string        peer;
};

struct HttpReply {
    int         status{200};
    std::string content_type{"application/json"};
    std::string body;
};

using RequestHandler = std::function<HttpReply(const HttpRequest&)>;

class HttpServer {
public:
    HttpServer(std::string address, u16 port, RequestHandler handler, int idle_timeout_ms = 30000);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind and listen without accepting; connections wait in the
    // backlog until start(). Throws on bind failure.
    void listen();

    // Start the accept thread, calling listen() first if needed
    void start();

    // Stop accepting, wait for open connections to finish
    void stop();

    bool serving() const { return running_.load(); }

    // Bound port (useful when constructed with port 0)
    u16 port() const { return bound_port_; }

private:
    std::string       address_;
    u16               port_;
    u16               bound_port_{0};
    RequestHandler    handler_;
    int               idle_timeout_ms_;
    std::atomic<bool> running_{false};

    boost::asio::io_context        ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread                    accept_thread_;

    // --- Connection threads (one per accepted socket, short-lived) ---
    std::vector<std::thread> connection_threads_;
    std::mutex               connection_mutex_;
    std::atomic<int>         open_connections_{0};

    void do_accept();

    void connection_thread(std::shared_ptr<boost::asio::io_context> ioc,
                           boost::asio::ip::tcp::socket sock);

    HttpReply dispatch(const HttpRequest& req);

    // Reap finished threads (detach)
    void cleanup_threads();
};
