// ============================================================
// metrics_sink.cpp
// ============================================================

#include "metrics_sink.hpp"
#include "../common/json_codec.hpp"
#include "../common/logger.hpp"
#include <fstream>
#include <stdexcept>

std::string DispatcherSnapshot::to_json() const {
    Json::Value v(Json::objectValue);
    v["timestamp"]      = (Json::UInt64)timestamp_ms;
    v["queue_depth"]    = (Json::UInt64)queue_depth;
    v["queue_capacity"] = (Json::UInt64)queue_capacity;
    v["workers"]        = workers;
    v["active_workers"] = active_workers;
    v["submitted"]      = (Json::UInt64)submitted;
    v["rejected"]       = (Json::UInt64)rejected;
    v["completed"]      = (Json::UInt64)completed;
    v["failed"]         = (Json::UInt64)failed;
    return json_codec::write(v);
}

void FileMetricsSink::emit(const DispatcherSnapshot& snap) {
    std::lock_guard<std::mutex> lk(mutex_);
    std::ofstream f(path_, std::ios::app);
    if (!f) {
        throw std::runtime_error("Cannot open metrics file " + path_);
    }
    f << snap.to_json() << "\n";
    if (!f) {
        throw std::runtime_error("Cannot write metrics file " + path_);
    }
}

void LogMetricsSink::emit(const DispatcherSnapshot& snap) {
    LOG_INFO("Dispatcher metrics " + snap.to_json());
}

std::shared_ptr<MetricsSink> make_metrics_sink(const std::string& path) {
    if (path.empty()) return std::make_shared<LogMetricsSink>();
    return std::make_shared<FileMetricsSink>(path);
}
