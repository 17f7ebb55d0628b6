#pragma once

// ============================================================
// metrics_sink.hpp -- Destinations for dispatcher load snapshots
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <mutex>
#include <memory>

struct DispatcherSnapshot {
    u64 timestamp_ms{0};
    u64 queue_depth{0};
    u64 queue_capacity{0};
    int workers{0};
    int active_workers{0};
    u64 submitted{0};
    u64 rejected{0};
    u64 completed{0};
    u64 failed{0};

    // One-line JSON object
    std::string to_json() const;
};

class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    // May throw; the dispatcher logs and carries on
    virtual void emit(const DispatcherSnapshot& snap) = 0;
};

// Appends one JSON line per snapshot
class FileMetricsSink : public MetricsSink {
public:
    explicit FileMetricsSink(std::string path) : path_(std::move(path)) {}

    void emit(const DispatcherSnapshot& snap) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex  mutex_;
};

// Writes snapshots to the process log at INFO
class LogMetricsSink : public MetricsSink {
public:
    void emit(const DispatcherSnapshot& snap) override;
};

// File sink when path is set, log sink otherwise
std::shared_ptr<MetricsSink> make_metrics_sink(const std::string& path);
