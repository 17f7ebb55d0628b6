#pragma once

// ============================================================
// platform.hpp -- OS helpers and portable integer types
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>
#include <stdexcept>

#ifndef _WIN32
#  include <sys/types.h>
#  include <unistd.h>
#  include <limits.h>
#  include <csignal>
#  include <cstring>
#  include <errno.h>
#endif

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

namespace platform {

// Ignore SIGPIPE: a peer closing an HTTP connection mid-write must
// surface as a write error, not kill the agent.
inline void init() {
#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

inline std::string hostname() {
#ifndef _WIN32
    char buf[HOST_NAME_MAX + 1] = {0};
    if (::gethostname(buf, sizeof(buf) - 1) != 0) {
        throw std::runtime_error(std::string("gethostname failed: ") + strerror(errno));
    }
    return buf;
#else
    return "localhost";
#endif
}

inline u32 uid() {
#ifndef _WIN32
    return (u32)::getuid();
#else
    return 0;
#endif
}

// Default agent alias, e.g. "T4_node42_1000"
inline std::string default_site_name() {
    return "T4_" + hostname() + "_" + std::to_string(uid());
}

} // namespace platform
