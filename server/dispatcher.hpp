#pragma once

// ============================================================
// dispatcher.hpp -- Bounded job queue served by a fixed worker pool
//
//   submit() --> [ FIFO queue, capacity Q ] --> W worker threads
//                   full: rejected ("busy")        run handler(job)
//
// A metrics thread emits a DispatcherSnapshot every interval.
// shutdown() stops admission, drains the queue, joins everything.
// ============================================================

#include "../common/records.hpp"
#include "metrics_sink.hpp"
#include <vector>
#include <deque>
#include <map>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <memory>
#include <atomic>

enum class JobState {
    QUEUED,
    RUNNING,
    SUCCEEDED,
    FAILED,
};

const char* job_state_name(JobState s);

struct JobRecord {
    u64             id{0};
    TransferRequest request;
    JobState        state{JobState::QUEUED};
    std::string     error;       // last error of a failed job
    u64             files_done{0};
    u64             bytes_done{0};
    u64             submitted_ms{0};
    u64             started_ms{0};
    u64             finished_ms{0};
};

// Outcome of a job that ran to completion
struct JobResult {
    u64 files{0};
    u64 bytes{0};
};

// Runs one job; throwing marks the job failed with e.what()
using JobHandler = std::function<JobResult(u64 job_id, const TransferRequest& req)>;

struct DispatcherConfig {
    int workers{4};
    int queue_size{100};
    int metrics_interval_s{600};   // 0 disables periodic metrics
    size_t history{1024};          // finished jobs kept for status queries
};

class Dispatcher {
public:
    Dispatcher(DispatcherConfig cfg, JobHandler handler, std::shared_ptr<MetricsSink> sink);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Queue a job. Returns false without blocking when the queue is full
    // or the dispatcher is shutting down.
    bool submit(const TransferRequest& req, u64* job_id = nullptr);

    bool job(u64 id, JobRecord& out) const;

    // Newest first
    std::vector<JobRecord> recent_jobs(size_t max_count) const;

    DispatcherSnapshot snapshot() const;

    // Push one snapshot to the sink now; sink failures are logged
    void emit_metrics();

    // Stop admission, run what is queued, join workers. Idempotent.
    void shutdown();

    int workers() const { return (int)workers_.size(); }

private:
    DispatcherConfig             cfg_;
    JobHandler                   handler_;
    std::shared_ptr<MetricsSink> sink_;

    std::vector<std::thread> workers_;
    std::thread              metrics_thread_;

    mutable std::mutex       mutex_;
    std::condition_variable  cv_;
    std::condition_variable  metrics_cv_;
    std::deque<u64>          queue_;
    std::map<u64, JobRecord> jobs_;
    std::deque<u64>          finished_;   // ids in completion order
    bool                     stop_{false};

    u64 next_id_{1};
    int active_{0};
    u64 submitted_{0};
    u64 rejected_{0};
    u64 completed_{0};
    u64 failed_{0};

    void worker_loop();
    void metrics_loop();
    void run_job(u64 id);
    void finish_job(u64 id, JobState state, const JobResult& result, const std::string& error);
};
