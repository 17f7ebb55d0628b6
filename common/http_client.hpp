#pragma once

// ============================================================
// http_client.hpp -- Blocking HTTP/1.1 client with a per-call deadline
// ============================================================

#include "platform.hpp"
#include "errors.hpp"
#include <string>

struct HttpResponse {
    int         status{0};
    std::string content_type;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

namespace http_client {

// Default deadline for connect + write + read of one call
static constexpr int DEFAULT_TIMEOUT_MS = 10000;

// Perform one request. Throws HttpError (status 0) on resolve/connect/
// timeout/transport failure; any HTTP status is returned to the caller.
HttpResponse request(const std::string& method,
                     const std::string& url,
                     const std::string& body,
                     const std::string& content_type,
                     int timeout_ms = DEFAULT_TIMEOUT_MS);

inline HttpResponse get(const std::string& url, int timeout_ms = DEFAULT_TIMEOUT_MS) {
    return request("GET", url, "", "", timeout_ms);
}

inline HttpResponse post(const std::string& url,
                         const std::string& body,
                         const std::string& content_type = "application/json",
                         int timeout_ms = DEFAULT_TIMEOUT_MS)
{
    return request("POST", url, body, content_type, timeout_ms);
}

// Like request(), but a non-2xx status also throws HttpError carrying it
HttpResponse expect_ok(const std::string& method,
                       const std::string& url,
                       const std::string& body,
                       const std::string& content_type,
                       int timeout_ms = DEFAULT_TIMEOUT_MS);

} // namespace http_client
