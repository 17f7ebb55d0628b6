#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cctype>
#include <sstream>
#include <iomanip>
#include <map>
#include <stdexcept>

namespace utils {

// Current time in milliseconds since epoch
inline u64 now_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    std::ostringstream ss;
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    } else if (bytes < 1024ULL * 1024) {
        ss << std::fixed << std::setprecision(2) << (double)bytes / 1024.0 << " KB";
    } else if (bytes < 1024ULL * 1024 * 1024) {
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024) << " MB";
    } else {
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
    }
    return ss.str();
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c + 32);
    }
    return s;
}

inline std::string to_hex(const u8* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

// ---- URLs ----

// Pieces of an agent URL, e.g. "http://host:8989/meshcp"
struct Url {
    std::string scheme;
    std::string host;
    u16         port{80};
    std::string base;   // path prefix without trailing '/', may be empty
};

inline Url parse_url(const std::string& url) {
    Url out;
    auto sep = url.find("://");
    if (sep == std::string::npos) {
        throw std::invalid_argument("URL without scheme: " + url);
    }
    out.scheme = to_lower(url.substr(0, sep));
    if (out.scheme != "http") {
        throw std::invalid_argument("Unsupported URL scheme: " + url);
    }
    std::string rest = url.substr(sep + 3);
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        out.base = rest.substr(slash);
        while (!out.base.empty() && out.base.back() == '/') out.base.pop_back();
    }
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        out.host = authority.substr(0, colon);
        int port = std::atoi(authority.substr(colon + 1).c_str());
        if (!validate_port(port)) {
            throw std::invalid_argument("Invalid port in URL: " + url);
        }
        out.port = (u16)port;
    } else {
        out.host = authority;
    }
    if (out.host.empty()) {
        throw std::invalid_argument("URL without host: " + url);
    }
    return out;
}

// Join an agent base URL and an endpoint ("/agents")
inline std::string join_url(const std::string& base, const std::string& endpoint) {
    std::string out = base;
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out + endpoint;
}

inline std::string url_encode(const std::string& s) {
    std::ostringstream ss;
    ss << std::hex << std::uppercase;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            ss << c;
        } else {
            ss << '%' << std::setw(2) << std::setfill('0') << (int)c;
        }
    }
    return ss.str();
}

inline std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int v = 0;
            if (std::sscanf(s.substr(i + 1, 2).c_str(), "%2x", &v) == 1) {
                out.push_back((char)v);
                i += 2;
                continue;
            }
        }
        out.push_back(s[i] == '+' ? ' ' : s[i]);
    }
    return out;
}

using QueryParams = std::map<std::string, std::string>;

// "a=1&b=x%20y" -> {a:1, b:"x y"}
inline QueryParams parse_query(const std::string& query) {
    QueryParams out;
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string kv = query.substr(pos, amp - pos);
        if (!kv.empty()) {
            size_t eq = kv.find('=');
            if (eq == std::string::npos) {
                out[url_decode(kv)] = "";
            } else {
                out[url_decode(kv.substr(0, eq))] = url_decode(kv.substr(eq + 1));
            }
        }
        pos = amp + 1;
    }
    return out;
}

inline std::string build_query(const QueryParams& params) {
    std::string out;
    for (auto& [k, v] : params) {
        if (v.empty()) continue;
        out += out.empty() ? "?" : "&";
        out += url_encode(k) + "=" + url_encode(v);
    }
    return out;
}

} // namespace utils
