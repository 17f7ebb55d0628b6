#pragma once

// ============================================================
// errors.hpp -- Exception types shared by agent and client
// ============================================================

#include <stdexcept>
#include <string>

// Bad or inconsistent configuration; aborts startup.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Transport failure or unexpected HTTP status talking to another agent.
class HttpError : public std::runtime_error {
public:
    HttpError(const std::string& msg, int status = 0)
        : std::runtime_error(msg), status_(status) {}

    // HTTP status code, 0 when no response was received at all
    int status() const { return status_; }

private:
    int status_;
};

// Transfer failure that a later attempt cannot fix (unknown source agent,
// no matching record at the source).
class PermanentError : public std::runtime_error {
public:
    explicit PermanentError(const std::string& msg) : std::runtime_error(msg) {}
};

// Transfer failure worth retrying (timeout, 5xx, corrupted chunk or content).
class TransientError : public std::runtime_error {
public:
    explicit TransientError(const std::string& msg) : std::runtime_error(msg) {}
};

// Local storage cannot take a file: over the size limit, out of space,
// or the file could not be created or written.
class StorageError : public std::runtime_error {
public:
    enum Kind { TOO_LARGE, UNAVAILABLE };

    StorageError(const std::string& msg, Kind kind = UNAVAILABLE)
        : std::runtime_error(msg), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};
