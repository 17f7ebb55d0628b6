// ============================================================
// http_client.cpp -- Boost.Beast implementation of http_client
// ============================================================

#include "http_client.hpp"
#include "utils.hpp"
#include "logger.hpp"
#include <chrono>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

// Largest body accepted (catalog dumps can be big)
static constexpr u64 MAX_RESPONSE_BODY = 1ull << 30;

// Request target: everything after the authority, "/" when empty
static std::string request_target(const std::string& url) {
    auto sep = url.find("://");
    auto slash = url.find('/', sep == std::string::npos ? 0 : sep + 3);
    if (slash == std::string::npos) return "/";
    return url.substr(slash);
}

HttpResponse http_client::request(const std::string& method,
                                  const std::string& url,
                                  const std::string& body,
                                  const std::string& content_type,
                                  int timeout_ms)
{
    utils::Url u;
    try {
        u = utils::parse_url(url);
    } catch (const std::invalid_argument& e) {
        throw HttpError(e.what());
    }

    http::verb verb = http::string_to_verb(method);
    if (verb == http::verb::unknown) {
        throw HttpError("Unsupported HTTP method: " + method);
    }

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    beast::error_code ec;
    auto endpoints = resolver.resolve(u.host, std::to_string(u.port), ec);
    if (ec) {
        throw HttpError("Cannot resolve " + u.host + ": " + ec.message());
    }

    http::request<http::string_body> req{verb, request_target(url), 11};
    req.set(http::field::host, u.host + ":" + std::to_string(u.port));
    req.set(http::field::user_agent, "meshcp/1.0");
    if (!body.empty() || verb == http::verb::post) {
        if (!content_type.empty()) req.set(http::field::content_type, content_type);
        req.body() = body;
        req.prepare_payload();
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_RESPONSE_BODY);

    // One deadline covers the whole exchange; run() returns once the
    // read completes or any step fails.
    stream.expires_after(std::chrono::milliseconds(timeout_ms));
    stream.async_connect(endpoints,
        [&](beast::error_code cec, const tcp::endpoint&) {
            if (cec) { ec = cec; return; }
            http::async_write(stream, req,
                [&](beast::error_code wec, std::size_t) {
                    if (wec) { ec = wec; return; }
                    http::async_read(stream, buffer, parser,
                        [&](beast::error_code rec, std::size_t) { ec = rec; });
                });
        });
    ioc.run();

    if (ec) {
        std::string what = (ec == beast::error::timeout)
            ? "timed out after " + std::to_string(timeout_ms) + " ms"
            : ec.message();
        throw HttpError(method + " " + url + " failed: " + what);
    }

    auto res = parser.release();
    beast::error_code shut_ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, shut_ec);

    HttpResponse out;
    out.status       = (int)res.result_int();
    out.content_type = std::string(res[http::field::content_type]);
    out.body         = std::move(res.body());
    LOG_DEBUG(method + " " + url + " -> " + std::to_string(out.status));
    return out;
}

HttpResponse http_client::expect_ok(const std::string& method,
                                    const std::string& url,
                                    const std::string& body,
                                    const std::string& content_type,
                                    int timeout_ms)
{
    HttpResponse res = request(method, url, body, content_type, timeout_ms);
    if (!res.ok()) {
        std::string detail = res.body.size() > 200 ? res.body.substr(0, 200) : res.body;
        throw HttpError(method + " " + url + " returned " + std::to_string(res.status) +
                        (detail.empty() ? "" : ": " + detail), res.status);
    }
    return res;
}
