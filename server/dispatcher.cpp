// ============================================================
// dispatcher.cpp
// ============================================================

#include "dispatcher.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <chrono>
#include <stdexcept>

const char* job_state_name(JobState s) {
    switch (s) {
        case JobState::QUEUED:    return "queued";
        case JobState::RUNNING:   return "running";
        case JobState::SUCCEEDED: return "succeeded";
        case JobState::FAILED:    return "failed";
    }
    return "unknown";
}

Dispatcher::Dispatcher(DispatcherConfig cfg, JobHandler handler, std::shared_ptr<MetricsSink> sink)
    : cfg_(cfg), handler_(std::move(handler)), sink_(std::move(sink))
{
    if (cfg_.workers < 0 || cfg_.queue_size < 0) {
        throw std::invalid_argument("Dispatcher needs non-negative worker and queue sizes");
    }
    if (!sink_) sink_ = std::make_shared<LogMetricsSink>();

    workers_.reserve((size_t)cfg_.workers);
    for (int i = 0; i < cfg_.workers; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    if (cfg_.metrics_interval_s > 0) {
        metrics_thread_ = std::thread([this] { metrics_loop(); });
    }
    LOG_INFO("Dispatcher started with " + std::to_string(cfg_.workers) + " workers, queue size " +
             std::to_string(cfg_.queue_size));
}

Dispatcher::~Dispatcher() {
    shutdown();
}

bool Dispatcher::submit(const TransferRequest& req, u64* job_id) {
    u64 id;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (stop_ || queue_.size() >= (size_t)cfg_.queue_size) {
            ++rejected_;
            return false;
        }
        id = next_id_++;
        JobRecord rec;
        rec.id           = id;
        rec.request      = req;
        rec.submitted_ms = utils::now_ms();
        jobs_[id] = std::move(rec);
        queue_.push_back(id);
        ++submitted_;
    }
    cv_.notify_one();
    if (job_id) *job_id = id;
    LOG_DEBUG("Queued job " + std::to_string(id) + " " + req.to_string());
    return true;
}

void Dispatcher::worker_loop() {
    for (;;) {
        u64 id;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
            if (stop_ && queue_.empty()) return;
            id = queue_.front();
            queue_.pop_front();
            JobRecord& rec = jobs_[id];
            rec.state      = JobState::RUNNING;
            rec.started_ms = utils::now_ms();
            ++active_;
        }
        run_job(id);
    }
}

void Dispatcher::run_job(u64 id) {
    TransferRequest req;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        req = jobs_[id].request;
    }
    LOG_INFO("Job " + std::to_string(id) + " started: " + req.to_string());

    try {
        JobResult result = handler_(id, req);
        finish_job(id, JobState::SUCCEEDED, result, "");
        LOG_INFO("Job " + std::to_string(id) + " succeeded: " +
                 std::to_string(result.files) + " files, " + utils::format_bytes(result.bytes));
    } catch (const std::exception& e) {
        finish_job(id, JobState::FAILED, JobResult{}, e.what());
        Logger::get().transfer_error("Job " + std::to_string(id) + " " + req.to_string() +
                                     " failed: " + e.what());
    }
}

void Dispatcher::finish_job(u64 id, JobState state, const JobResult& result,
                            const std::string& error)
{
    std::lock_guard<std::mutex> lk(mutex_);
    JobRecord& rec = jobs_[id];
    rec.state       = state;
    rec.error       = error;
    rec.files_done  = result.files;
    rec.bytes_done  = result.bytes;
    rec.finished_ms = utils::now_ms();
    --active_;
    if (state == JobState::SUCCEEDED) ++completed_;
    else ++failed_;

    finished_.push_back(id);
    while (finished_.size() > cfg_.history) {
        jobs_.erase(finished_.front());
        finished_.pop_front();
    }
}

bool Dispatcher::job(u64 id, JobRecord& out) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return false;
    out = it->second;
    return true;
}

std::vector<JobRecord> Dispatcher::recent_jobs(size_t max_count) const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<JobRecord> out;
    for (auto it = jobs_.rbegin(); it != jobs_.rend() && out.size() < max_count; ++it) {
        out.push_back(it->second);
    }
    return out;
}

DispatcherSnapshot Dispatcher::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    DispatcherSnapshot s;
    s.timestamp_ms   = utils::now_ms();
    s.queue_depth    = queue_.size();
    s.queue_capacity = (u64)cfg_.queue_size;
    s.workers        = cfg_.workers;
    s.active_workers = active_;
    s.submitted      = submitted_;
    s.rejected       = rejected_;
    s.completed      = completed_;
    s.failed         = failed_;
    return s;
}

void Dispatcher::emit_metrics() {
    DispatcherSnapshot snap = snapshot();
    try {
        sink_->emit(snap);
    } catch (const std::exception& e) {
        LOG_WARN("Unable to emit dispatcher metrics: " + std::string(e.what()));
    }
}

void Dispatcher::metrics_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        if (metrics_cv_.wait_for(lock, std::chrono::seconds(cfg_.metrics_interval_s),
                                 [this] { return stop_; })) {
            break;
        }
        lock.unlock();
        emit_metrics();
        lock.lock();
    }
}

void Dispatcher::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (stop_) return;
        stop_ = true;
    }
    LOG_INFO("Dispatcher shutting down, draining " + std::to_string(snapshot().queue_depth) +
             " queued jobs");
    cv_.notify_all();
    metrics_cv_.notify_all();

    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    if (metrics_thread_.joinable()) metrics_thread_.join();

    // Without workers nothing drained the queue
    std::lock_guard<std::mutex> lk(mutex_);
    for (u64 id : queue_) {
        JobRecord& rec = jobs_[id];
        rec.state       = JobState::FAILED;
        rec.error       = "dispatcher shut down before the job ran";
        rec.finished_ms = utils::now_ms();
        ++failed_;
    }
    if (!queue_.empty()) {
        LOG_WARN(std::to_string(queue_.size()) + " queued jobs never ran");
    }
    queue_.clear();
}
