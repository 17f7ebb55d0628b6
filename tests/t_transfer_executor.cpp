// ============================================================
// t_transfer_executor.cpp -- Resolve, fetch, verify, store, commit
// ============================================================

#include <gtest/gtest.h>

#include "testutil.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/protocol_io.hpp"
#include "../server/transfer_executor.hpp"
#include <algorithm>
#include <functional>
#include <map>
#include <mutex>

class NullTransport : public MeshTransport {
public:
    void announce(const std::string&, const AgentInfo&) override {}
    AgentTable fetch_agents(const std::string&) override { return {}; }
};

// Source agent serving files from memory
class FakeSource : public RemoteAgent {
public:
    void add(const std::string& lfn, const std::string& content,
             const std::string& block = "/d/A#1") {
        CatalogEntry e = make_entry(lfn, "/d/A", block, content);
        e.pfn = "/source" + block + lfn;
        entries_.push_back(e);
        content_[block + lfn] = content;
    }

    // New content under an existing name, as after an in-place rewrite
    void replace(const std::string& lfn, const std::string& content,
                 const std::string& block = "/d/A#1") {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto& e : entries_) {
            if (e.lfn != lfn || e.block != block) continue;
            e.bytes = (i64)content.size();
            e.hash  = sha256_of(content);
        }
        content_[block + lfn] = content;
    }

    std::vector<CatalogEntry> records(const std::string& agent_url,
                                      const TransferRequest& filter) override {
        std::lock_guard<std::mutex> lk(mutex_);
        ++record_calls_;
        last_url_ = agent_url;
        if (records_failures_ > 0) {
            --records_failures_;
            throw HttpError("source busy", 503);
        }
        std::vector<CatalogEntry> out;
        for (auto& e : entries_) {
            if (!filter.dataset.empty() && filter.dataset != e.dataset) continue;
            if (!filter.block.empty() && filter.block != e.block) continue;
            if (!filter.file.empty() && filter.file != e.lfn) continue;
            out.push_back(e);
        }
        return out;
    }

    std::string fetch_chunk(const std::string&, const CatalogEntry& entry,
                            u64 offset, u32 length) override {
        if (on_fetch_) on_fetch_();
        std::lock_guard<std::mutex> lk(mutex_);
        ++fetch_calls_;
        if (fetch_status_ != 0) throw HttpError("fetch refused", fetch_status_);

        std::string data = content_.at(entry.block + entry.lfn);
        if (bad_passes_ > 0 && !data.empty()) data[data.size() / 2] ^= 0x01;

        u64 len = std::min<u64>(length, data.size() - offset);
        bool last = offset + len >= data.size();
        if (last && bad_passes_ > 0) --bad_passes_;
        return proto::encode_chunk(offset, data.data() + offset, (u32)len, true, last);
    }

    std::vector<CatalogEntry>          entries_;
    std::map<std::string, std::string> content_;
    std::mutex                         mutex_;
    int         bad_passes_{0};        // whole-file passes served with one flipped byte
    int         records_failures_{0};
    int         fetch_status_{0};
    int         record_calls_{0};
    int         fetch_calls_{0};
    std::string last_url_;
    std::function<void()> on_fetch_;    // runs before each chunk is served
};

class T_TransferExecutor : public ::testing::Test {
protected:
    void SetUp() override {
        AgentInfo self;
        self.alias = "T2_DST";
        self.agent = "http://dst:8989/meshcp";
        mesh_ = std::make_unique<AgentMesh>(self, transport_);
        mesh_->register_self();

        AgentInfo src;
        src.alias = "T1_SRC";
        src.agent = "http://src:8989/meshcp";
        mesh_->upsert(src);

        catalog_ = open_sqlite_catalog(dir_.file("tfc.db"));

        ExecutorConfig cfg;
        cfg.storage               = dir_.file("storage");
        cfg.retry.attempts        = 3;
        cfg.retry.backoff_init_ms = 1;
        cfg.retry.backoff_max_ms  = 4;
        executor_ = std::make_unique<TransferExecutor>(cfg, *catalog_, *mesh_, source_);
    }

    TransferRequest request(const std::string& file = "") {
        TransferRequest r;
        r.dataset   = "/d/A";
        r.file      = file;
        r.src_alias = "T1_SRC";
        return r;
    }

    std::string stored_path(const std::string& lfn, const std::string& block = "/d/A#1") {
        return file_io::storage_path(dir_.file("storage"), "/d/A", block, lfn).string();
    }

    std::string stored(const std::string& lfn, const std::string& block = "/d/A#1") {
        return read_file(stored_path(lfn, block));
    }

    bool tmp_area_empty() {
        return fs::is_empty(dir_.path() / "storage" / ".meshcp" / "tmp");
    }

    TempDir                           dir_;
    NullTransport                     transport_;
    FakeSource                        source_;
    std::unique_ptr<AgentMesh>        mesh_;
    std::unique_ptr<Catalog>          catalog_;
    std::unique_ptr<TransferExecutor> executor_;
};

TEST_F(T_TransferExecutor, TransfersAndCatalogs) {
    std::string big   = random_bytes(2 * TRANSFER_CHUNK_SIZE + 123, 1);
    std::string small = "hello mesh";
    source_.add("/store/big.dat", big);
    source_.add("/store/small.txt", small);

    JobResult res = executor_->run(1, request());
    EXPECT_EQ(2u, res.files);
    EXPECT_EQ(big.size() + small.size(), res.bytes);
    EXPECT_EQ("http://src:8989/meshcp", source_.last_url_);

    EXPECT_EQ(big, stored("/store/big.dat"));
    EXPECT_EQ(small, stored("/store/small.txt"));
    EXPECT_EQ(sha256_of(big), file_io::sha256_file(stored_path("/store/big.dat")));

    auto local = catalog_->records(TransferRequest{});
    ASSERT_EQ(2u, local.size());
    EXPECT_EQ(sha256_of(big), local[0].hash);
    EXPECT_EQ((i64)big.size(), local[0].bytes);
    EXPECT_EQ("/d/A#1", local[0].block);
    EXPECT_TRUE(fs::path(local[0].pfn).is_absolute());
    EXPECT_EQ(fs::absolute(stored_path("/store/big.dat")).string(), local[0].pfn);
    EXPECT_TRUE(tmp_area_empty());
}

TEST_F(T_TransferExecutor, EmptyFile) {
    source_.add("/store/empty", "");
    JobResult res = executor_->run(1, request());
    EXPECT_EQ(1u, res.files);
    EXPECT_EQ(0u, res.bytes);
    EXPECT_TRUE(fs::exists(stored_path("/store/empty")));
    EXPECT_EQ(sha256_of(""), catalog_->records(TransferRequest{})[0].hash);
}

TEST_F(T_TransferExecutor, RetriesCorruptContent) {
    std::string data = random_bytes(5000, 2);
    source_.add("/store/flaky", data);
    source_.bad_passes_ = 2;

    JobResult res = executor_->run(7, request());
    EXPECT_EQ(1u, res.files);
    EXPECT_EQ(3, source_.fetch_calls_);
    EXPECT_EQ(data, stored("/store/flaky"));
    EXPECT_TRUE(tmp_area_empty());
}

TEST_F(T_TransferExecutor, GivesUpAfterAttempts) {
    source_.add("/store/broken", random_bytes(5000, 3));
    source_.bad_passes_ = 10;

    EXPECT_THROW(executor_->run(8, request()), TransientError);
    EXPECT_EQ(3, source_.fetch_calls_);
    EXPECT_FALSE(fs::exists(stored_path("/store/broken")));
    EXPECT_TRUE(catalog_->records(TransferRequest{}).empty());
    EXPECT_TRUE(tmp_area_empty());
}

TEST_F(T_TransferExecutor, UnresolvableSourceIsPermanent) {
    source_.add("/store/x", "x");

    TransferRequest r = request();
    r.src_alias = "T9_NOBODY";
    EXPECT_THROW(executor_->run(1, r), PermanentError);

    r.src_alias = "";
    EXPECT_THROW(executor_->run(1, r), PermanentError);

    r.src_alias = "T2_DST";
    EXPECT_THROW(executor_->run(1, r), PermanentError);

    EXPECT_EQ(0, source_.record_calls_);
}

TEST_F(T_TransferExecutor, NoRecordsIsPermanent) {
    source_.add("/store/x", "x");
    EXPECT_THROW(executor_->run(1, request("/store/other")), PermanentError);
    EXPECT_EQ(0, source_.fetch_calls_);
}

TEST_F(T_TransferExecutor, ClientErrorIsNotRetried) {
    source_.add("/store/gone", "gone");
    source_.fetch_status_ = 404;
    EXPECT_THROW(executor_->run(1, request()), PermanentError);
    EXPECT_EQ(1, source_.fetch_calls_);
}

TEST_F(T_TransferExecutor, ServerErrorIsRetried) {
    source_.add("/store/x", "x");
    source_.fetch_status_ = 500;
    EXPECT_THROW(executor_->run(1, request()), TransientError);
    EXPECT_EQ(3, source_.fetch_calls_);
}

TEST_F(T_TransferExecutor, CatalogQueryRetried) {
    source_.add("/store/x", "x");
    source_.records_failures_ = 2;
    EXPECT_EQ(1u, executor_->run(1, request()).files);
    EXPECT_EQ(3, source_.record_calls_);
}

TEST_F(T_TransferExecutor, UnsafeNameIsPermanent) {
    source_.add("/../../escape", "x");
    EXPECT_THROW(executor_->run(1, request()), PermanentError);
    EXPECT_EQ(0, source_.fetch_calls_);
}

TEST_F(T_TransferExecutor, RepeatIsIdempotent) {
    source_.add("/store/a", "aaaa");
    source_.add("/store/b", "bbbb");
    ASSERT_EQ(2u, executor_->run(1, request()).files);
    int fetches = source_.fetch_calls_;

    JobResult again = executor_->run(2, request());
    EXPECT_EQ(2u, again.files);
    EXPECT_EQ(0u, again.bytes);
    EXPECT_EQ(fetches, source_.fetch_calls_);
    EXPECT_EQ(2u, catalog_->records(TransferRequest{}).size());
}

TEST_F(T_TransferExecutor, SameLfnInTwoBlocks) {
    std::string one = random_bytes(3000, 4);
    std::string two = random_bytes(4000, 5);
    source_.add("/store/x", one, "/d/A#1");
    source_.add("/store/x", two, "/d/A#2");

    JobResult res = executor_->run(1, request());
    EXPECT_EQ(2u, res.files);
    EXPECT_EQ(one, stored("/store/x", "/d/A#1"));
    EXPECT_EQ(two, stored("/store/x", "/d/A#2"));

    auto local = catalog_->records(TransferRequest{});
    ASSERT_EQ(2u, local.size());
    EXPECT_NE(local[0].pfn, local[1].pfn);
    for (auto& e : local) {
        EXPECT_EQ(e.hash, file_io::sha256_file(e.pfn)) << e.to_string();
    }
}

TEST_F(T_TransferExecutor, ChangedSourceContentIsConflict) {
    source_.add("/store/v", "version one");
    ASSERT_EQ(1u, executor_->run(1, request()).files);
    int fetches = source_.fetch_calls_;

    source_.replace("/store/v", "version two, different");
    EXPECT_THROW(executor_->run(2, request()), PermanentError);
    EXPECT_EQ(fetches, source_.fetch_calls_);

    EXPECT_EQ("version one", stored("/store/v"));
    auto local = catalog_->records(TransferRequest{});
    ASSERT_EQ(1u, local.size());
    EXPECT_EQ(sha256_of("version one"), local[0].hash);
    EXPECT_EQ(local[0].hash, file_io::sha256_file(local[0].pfn));
    EXPECT_TRUE(tmp_area_empty());
}

TEST_F(T_TransferExecutor, ConflictDuringFetchKeepsLocalFile) {
    source_.add("/store/race", "incoming content");

    CatalogEntry other = make_entry("/store/race", "/d/A", "/d/A#1", "cataloged meanwhile");
    other.pfn = stored_path("/store/race");
    source_.on_fetch_ = [&] {
        if (!catalog_->records(TransferRequest{}).empty()) return;
        write_file(other.pfn, "cataloged meanwhile");
        catalog_->add(other);
    };

    EXPECT_THROW(executor_->run(1, request()), PermanentError);
    EXPECT_EQ("cataloged meanwhile", stored("/store/race"));
    auto local = catalog_->records(TransferRequest{});
    ASSERT_EQ(1u, local.size());
    EXPECT_EQ(local[0].hash, file_io::sha256_file(local[0].pfn));
    EXPECT_TRUE(tmp_area_empty());
}

TEST(T_Backoff, DoublesUpToCap) {
    Backoff b(100, 1000);
    u32 first = b.next();
    EXPECT_GE(first, 1u);
    EXPECT_LE(first, 100u);

    u32 prev = first;
    for (int i = 0; i < 20; ++i) {
        u32 d = b.next();
        EXPECT_LE(d, 1000u);
        EXPECT_EQ(std::min<u32>(prev * 2, 1000u), d);
        prev = d;
    }
    EXPECT_EQ(1000u, prev);
}
