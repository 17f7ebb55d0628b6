// ============================================================
// t_dispatcher.cpp -- Bounded queue, worker pool, metrics
// ============================================================

#include <gtest/gtest.h>

#include "testutil.hpp"
#include "../common/json_codec.hpp"
#include "../server/dispatcher.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

class RecordingSink : public MetricsSink {
public:
    void emit(const DispatcherSnapshot& snap) override {
        std::lock_guard<std::mutex> lk(mutex_);
        snaps_.push_back(snap);
    }
    std::vector<DispatcherSnapshot> snaps() {
        std::lock_guard<std::mutex> lk(mutex_);
        return snaps_;
    }

private:
    std::mutex                      mutex_;
    std::vector<DispatcherSnapshot> snaps_;
};

class ThrowingSink : public MetricsSink {
public:
    void emit(const DispatcherSnapshot&) override {
        ++calls_;
        throw std::runtime_error("sink down");
    }
    std::atomic<int> calls_{0};
};

// Handler jobs wait on until released
class Gate {
public:
    void wait() {
        std::unique_lock<std::mutex> lk(mutex_);
        ++waiting_;
        cv_.notify_all();
        cv_.wait(lk, [this] { return open_; });
    }
    void open() {
        std::lock_guard<std::mutex> lk(mutex_);
        open_ = true;
        cv_.notify_all();
    }
    bool wait_for_waiters(int n) {
        std::unique_lock<std::mutex> lk(mutex_);
        return cv_.wait_for(lk, std::chrono::seconds(5), [&] { return waiting_ >= n; });
    }

private:
    std::mutex              mutex_;
    std::condition_variable cv_;
    int                     waiting_{0};
    bool                    open_{false};
};

static TransferRequest req(const std::string& dataset) {
    TransferRequest r;
    r.dataset   = dataset;
    r.src_alias = "T1_SRC";
    return r;
}

static DispatcherConfig config(int workers, int queue) {
    DispatcherConfig c;
    c.workers            = workers;
    c.queue_size         = queue;
    c.metrics_interval_s = 0;
    return c;
}

TEST(T_Dispatcher, RejectsWhenQueueFull) {
    auto sink = std::make_shared<RecordingSink>();
    Dispatcher d(config(0, 3), [](u64, const TransferRequest&) { return JobResult{}; }, sink);

    u64 id = 0;
    EXPECT_TRUE(d.submit(req("/a"), &id));
    EXPECT_EQ(1u, id);
    EXPECT_TRUE(d.submit(req("/b")));
    EXPECT_TRUE(d.submit(req("/c")));
    EXPECT_FALSE(d.submit(req("/d")));

    DispatcherSnapshot s = d.snapshot();
    EXPECT_EQ(3u, s.queue_depth);
    EXPECT_EQ(3u, s.queue_capacity);
    EXPECT_EQ(3u, s.submitted);
    EXPECT_EQ(1u, s.rejected);
    EXPECT_EQ(0, s.workers);
}

TEST(T_Dispatcher, QueuedJobsFailWithoutWorkers) {
    Dispatcher d(config(0, 2), [](u64, const TransferRequest&) { return JobResult{}; }, nullptr);
    u64 id = 0;
    ASSERT_TRUE(d.submit(req("/a"), &id));
    d.shutdown();

    JobRecord rec;
    ASSERT_TRUE(d.job(id, rec));
    EXPECT_EQ(JobState::FAILED, rec.state);
    EXPECT_FALSE(rec.error.empty());
    EXPECT_FALSE(d.submit(req("/b")));
}

TEST(T_Dispatcher, SingleWorkerIsFifo) {
    std::mutex mutex;
    std::vector<std::string> order;
    Gate gate;

    Dispatcher d(config(1, 10), [&](u64, const TransferRequest& r) {
        gate.wait();
        std::lock_guard<std::mutex> lk(mutex);
        order.push_back(r.dataset);
        return JobResult{1, 10};
    }, nullptr);

    for (auto ds : {"/1", "/2", "/3", "/4", "/5"}) ASSERT_TRUE(d.submit(req(ds)));
    ASSERT_TRUE(gate.wait_for_waiters(1));
    gate.open();
    d.shutdown();

    EXPECT_EQ((std::vector<std::string>{"/1", "/2", "/3", "/4", "/5"}), order);
    DispatcherSnapshot s = d.snapshot();
    EXPECT_EQ(5u, s.completed);
    EXPECT_EQ(0u, s.failed);
    EXPECT_EQ(0u, s.queue_depth);
}

TEST(T_Dispatcher, ShutdownDrainsQueue) {
    std::atomic<int> ran{0};
    Dispatcher d(config(2, 50), [&](u64, const TransferRequest&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        ++ran;
        return JobResult{};
    }, nullptr);

    for (int i = 0; i < 30; ++i) ASSERT_TRUE(d.submit(req("/x")));
    d.shutdown();
    d.shutdown();

    EXPECT_EQ(30, ran.load());
    EXPECT_EQ(30u, d.snapshot().completed);
}

TEST(T_Dispatcher, RunningJobsOccupyWorkers) {
    Gate gate;
    Dispatcher d(config(2, 1), [&](u64, const TransferRequest&) {
        gate.wait();
        return JobResult{};
    }, nullptr);

    ASSERT_TRUE(d.submit(req("/1")));
    ASSERT_TRUE(d.submit(req("/2")));
    ASSERT_TRUE(gate.wait_for_waiters(2));

    EXPECT_EQ(2, d.snapshot().active_workers);
    EXPECT_TRUE(d.submit(req("/3")));
    EXPECT_FALSE(d.submit(req("/4")));

    gate.open();
    d.shutdown();
    EXPECT_EQ(3u, d.snapshot().completed);
    EXPECT_EQ(1u, d.snapshot().rejected);
}

TEST(T_Dispatcher, JobRecords) {
    Dispatcher d(config(1, 10), [](u64, const TransferRequest& r) -> JobResult {
        if (r.dataset == "/bad") throw std::runtime_error("source vanished");
        return JobResult{2, 2048};
    }, nullptr);

    u64 good = 0, bad = 0;
    ASSERT_TRUE(d.submit(req("/good"), &good));
    ASSERT_TRUE(d.submit(req("/bad"), &bad));
    d.shutdown();

    JobRecord rec;
    ASSERT_TRUE(d.job(good, rec));
    EXPECT_EQ(JobState::SUCCEEDED, rec.state);
    EXPECT_EQ(2u, rec.files_done);
    EXPECT_EQ(2048u, rec.bytes_done);
    EXPECT_GE(rec.finished_ms, rec.started_ms);

    ASSERT_TRUE(d.job(bad, rec));
    EXPECT_EQ(JobState::FAILED, rec.state);
    EXPECT_EQ("source vanished", rec.error);
    EXPECT_STREQ("failed", job_state_name(rec.state));

    EXPECT_FALSE(d.job(999, rec));

    auto recent = d.recent_jobs(10);
    ASSERT_EQ(2u, recent.size());
    EXPECT_EQ(bad, recent[0].id);
    EXPECT_EQ(1u, d.snapshot().failed);
}

TEST(T_Dispatcher, HistoryIsBounded) {
    DispatcherConfig c = config(1, 10);
    c.history = 2;
    Dispatcher d(c, [](u64, const TransferRequest&) { return JobResult{}; }, nullptr);

    std::vector<u64> ids(5);
    for (auto& id : ids) ASSERT_TRUE(d.submit(req("/h"), &id));
    d.shutdown();

    JobRecord rec;
    EXPECT_FALSE(d.job(ids[0], rec));
    EXPECT_TRUE(d.job(ids[4], rec));
    EXPECT_EQ(2u, d.recent_jobs(10).size());
}

TEST(T_Dispatcher, EmitMetrics) {
    auto sink = std::make_shared<RecordingSink>();
    Dispatcher d(config(0, 4), [](u64, const TransferRequest&) { return JobResult{}; }, sink);
    d.submit(req("/m"));
    d.emit_metrics();

    auto snaps = sink->snaps();
    ASSERT_EQ(1u, snaps.size());
    EXPECT_EQ(1u, snaps[0].queue_depth);
    EXPECT_EQ(4u, snaps[0].queue_capacity);
    EXPECT_GT(snaps[0].timestamp_ms, 0u);
}

TEST(T_Dispatcher, PeriodicMetrics) {
    auto sink = std::make_shared<RecordingSink>();
    DispatcherConfig c = config(1, 4);
    c.metrics_interval_s = 1;
    Dispatcher d(c, [](u64, const TransferRequest&) { return JobResult{}; }, sink);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (sink->snaps().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    d.shutdown();
    EXPECT_FALSE(sink->snaps().empty());
}

TEST(T_Dispatcher, FailingSinkIsTolerated) {
    auto sink = std::make_shared<ThrowingSink>();
    Dispatcher d(config(1, 4), [](u64, const TransferRequest&) { return JobResult{1, 1}; }, sink);
    EXPECT_NO_THROW(d.emit_metrics());
    EXPECT_EQ(1, sink->calls_.load());

    ASSERT_TRUE(d.submit(req("/after")));
    d.shutdown();
    EXPECT_EQ(1u, d.snapshot().completed);
}

TEST(T_MetricsSink, FileSinkAppendsJsonLines) {
    TempDir dir;
    FileMetricsSink sink(dir.file("metrics.log"));

    DispatcherSnapshot s;
    s.timestamp_ms = 1000;
    s.queue_depth  = 3;
    s.workers      = 4;
    sink.emit(s);
    s.queue_depth = 1;
    sink.emit(s);

    std::string text = read_file(dir.file("metrics.log"));
    size_t nl = text.find('\n');
    ASSERT_NE(std::string::npos, nl);
    Json::Value first = json_codec::parse(text.substr(0, nl));
    EXPECT_EQ(3u, first["queue_depth"].asUInt64());
    EXPECT_EQ(4, first["workers"].asInt());
    Json::Value second = json_codec::parse(text.substr(nl + 1));
    EXPECT_EQ(1u, second["queue_depth"].asUInt64());
}

TEST(T_MetricsSink, UnwritableFileThrows) {
    TempDir dir;
    FileMetricsSink sink(dir.file("no/such/dir/metrics.log"));
    EXPECT_THROW(sink.emit(DispatcherSnapshot{}), std::runtime_error);
}
