// ============================================================
// t_upload_receiver.cpp -- Chunked pushes into the agent
// ============================================================

#include <gtest/gtest.h>

#include "testutil.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/protocol_io.hpp"
#include "../server/upload_receiver.hpp"
#include <stdexcept>
#include <vector>
#include <algorithm>
#include <chrono>
#include <thread>

class T_UploadReceiver : public ::testing::Test {
protected:
    void SetUp() override {
        catalog_  = open_sqlite_catalog(dir_.file("tfc.db"));
        receiver_ = std::make_unique<UploadReceiver>(dir_.file("storage"), *catalog_);
    }

    UploadMeta meta_for(const std::string& lfn, const std::string& content) {
        UploadMeta m;
        m.lfn     = lfn;
        m.dataset = "/d/U";
        m.block   = "/d/U#1";
        m.bytes   = (i64)content.size();
        m.hash    = sha256_of(content);
        return m;
    }

    // Frames of content cut into pieces of at most piece bytes
    std::vector<std::string> frames(const std::string& content, size_t piece) {
        std::vector<std::string> out;
        size_t off = 0;
        do {
            size_t len = std::min(piece, content.size() - off);
            bool last  = off + len >= content.size();
            out.push_back(proto::encode_chunk(off, content.data() + off, (u32)len, true, last));
            off += len;
        } while (off < content.size());
        return out;
    }

    std::string stored_path(const std::string& lfn) {
        return file_io::storage_path(dir_.file("storage"), "/d/U", "/d/U#1", lfn).string();
    }

    bool tmp_area_empty() {
        return fs::is_empty(dir_.path() / "storage" / ".meshcp" / "tmp");
    }

    // Pushes content in one frame, returns the final status
    UploadStatus push(UploadReceiver& r, const std::string& lfn, const std::string& content) {
        UploadMeta meta = meta_for(lfn, content);
        UploadStatus st = UploadStatus::PARTIAL;
        for (auto& f : frames(content, 4096)) st = r.on_chunk(meta, f);
        return st;
    }

    TempDir                         dir_;
    std::unique_ptr<Catalog>        catalog_;
    std::unique_ptr<UploadReceiver> receiver_;
};

TEST_F(T_UploadReceiver, StoresAndCatalogs) {
    std::string content = random_bytes(10000, 5);
    UploadMeta meta = meta_for("/store/up.bin", content);
    auto f = frames(content, 4000);
    ASSERT_EQ(3u, f.size());

    EXPECT_EQ(UploadStatus::PARTIAL, receiver_->on_chunk(meta, f[0]));
    EXPECT_EQ(UploadStatus::PARTIAL, receiver_->on_chunk(meta, f[1]));
    EXPECT_EQ(1u, receiver_->active_uploads());
    EXPECT_EQ(UploadStatus::COMPLETE, receiver_->on_chunk(meta, f[2]));
    EXPECT_EQ(0u, receiver_->active_uploads());

    EXPECT_EQ(content, read_file(stored_path("/store/up.bin")));
    auto rec = catalog_->records(TransferRequest{});
    ASSERT_EQ(1u, rec.size());
    EXPECT_EQ("/store/up.bin", rec[0].lfn);
    EXPECT_EQ("/d/U#1", rec[0].block);
    EXPECT_EQ(meta.hash, rec[0].hash);
    EXPECT_EQ(stored_path("/store/up.bin"), rec[0].pfn);
    EXPECT_TRUE(tmp_area_empty());
}

TEST_F(T_UploadReceiver, EmptyFile) {
    UploadMeta meta = meta_for("/store/empty", "");
    EXPECT_EQ(UploadStatus::COMPLETE, receiver_->on_chunk(meta, frames("", 10)[0]));
    EXPECT_TRUE(fs::exists(stored_path("/store/empty")));
}

TEST_F(T_UploadReceiver, HashMismatchDropsUpload) {
    std::string content = "the real content";
    UploadMeta meta = meta_for("/store/lie", content);
    meta.hash = sha256_of("something else");

    EXPECT_THROW(receiver_->on_chunk(meta, frames(content, 100)[0]), TransientError);
    EXPECT_EQ(0u, receiver_->active_uploads());
    EXPECT_FALSE(fs::exists(stored_path("/store/lie")));
    EXPECT_TRUE(catalog_->records(TransferRequest{}).empty());
}

TEST_F(T_UploadReceiver, OutOfOrderChunk) {
    std::string content = random_bytes(300, 6);
    UploadMeta meta = meta_for("/store/ooo", content);
    auto f = frames(content, 100);

    EXPECT_THROW(receiver_->on_chunk(meta, f[1]), std::invalid_argument);

    receiver_->on_chunk(meta, f[0]);
    EXPECT_THROW(receiver_->on_chunk(meta, f[2]), TransientError);
    EXPECT_EQ(0u, receiver_->active_uploads());
}

TEST_F(T_UploadReceiver, RestartAtOffsetZero) {
    std::string content = random_bytes(300, 8);
    UploadMeta meta = meta_for("/store/again", content);
    auto f = frames(content, 100);

    receiver_->on_chunk(meta, f[0]);
    receiver_->on_chunk(meta, f[1]);
    receiver_->on_chunk(meta, f[0]);
    receiver_->on_chunk(meta, f[1]);
    EXPECT_EQ(UploadStatus::COMPLETE, receiver_->on_chunk(meta, f[2]));
    EXPECT_EQ(content, read_file(stored_path("/store/again")));
}

TEST_F(T_UploadReceiver, OversizeChunk) {
    std::string content = random_bytes(200, 9);
    UploadMeta meta = meta_for("/store/big", content);
    meta.bytes = 100;
    EXPECT_THROW(receiver_->on_chunk(meta, frames(content, 200)[0]), TransientError);
}

TEST_F(T_UploadReceiver, MalformedRequests) {
    std::string content = "abc";
    std::string frame = frames(content, 10)[0];

    UploadMeta meta = meta_for("/store/m", content);
    meta.block = "";
    EXPECT_THROW(receiver_->on_chunk(meta, frame), std::invalid_argument);

    meta = meta_for("/../outside", content);
    EXPECT_THROW(receiver_->on_chunk(meta, frame), std::invalid_argument);

    meta = meta_for("/store/m", content);
    meta.bytes = -1;
    EXPECT_THROW(receiver_->on_chunk(meta, frame), std::invalid_argument);

    meta = meta_for("/store/m", content);
    EXPECT_THROW(receiver_->on_chunk(meta, "garbage"), TransientError);
}

TEST_F(T_UploadReceiver, IdleUploadsExpire) {
    UploadReceiver quick(dir_.file("storage"), *catalog_, 0);
    std::string content = random_bytes(200, 10);
    auto f = frames(content, 100);

    UploadMeta stale = meta_for("/store/stale", content);
    quick.on_chunk(stale, f[0]);
    EXPECT_EQ(1u, quick.active_uploads());

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    UploadMeta other = meta_for("/store/other", "x");
    quick.on_chunk(other, frames("x", 10)[0]);
    EXPECT_EQ(0u, quick.active_uploads());
    EXPECT_THROW(quick.on_chunk(stale, f[1]), std::invalid_argument);
}

TEST_F(T_UploadReceiver, SizeOverLimitRefused) {
    UploadReceiver small(dir_.file("storage"), *catalog_, 600000, 1000);
    EXPECT_EQ(1000u, small.max_bytes());

    std::string content = random_bytes(1001, 11);
    UploadMeta meta = meta_for("/store/huge", content);
    try {
        small.on_chunk(meta, frames(content, 100)[0]);
        FAIL() << "upload over the limit accepted";
    } catch (const StorageError& e) {
        EXPECT_EQ(StorageError::TOO_LARGE, e.kind());
    }
    EXPECT_EQ(0u, small.active_uploads());
    EXPECT_TRUE(tmp_area_empty());

    EXPECT_EQ(UploadStatus::COMPLETE, push(small, "/store/fits", random_bytes(1000, 12)));
}

TEST_F(T_UploadReceiver, SizeOverFreeSpaceRefused) {
    UploadReceiver unlimited(dir_.file("storage"), *catalog_, 600000, ~0ull);
    UploadMeta meta = meta_for("/store/vast", "abc");
    meta.bytes = (i64)(1ull << 62);
    try {
        unlimited.on_chunk(meta, frames("abc", 10)[0]);
        FAIL() << "upload over the free space accepted";
    } catch (const StorageError& e) {
        EXPECT_EQ(StorageError::UNAVAILABLE, e.kind());
    }
    EXPECT_EQ(0u, unlimited.active_uploads());
    EXPECT_TRUE(tmp_area_empty());
    EXPECT_FALSE(fs::exists(stored_path("/store/vast")));
}

TEST_F(T_UploadReceiver, OtherContentUnderCatalogedNameRefused) {
    ASSERT_EQ(UploadStatus::COMPLETE, push(*receiver_, "/store/v", "version one"));

    std::string changed = "version two, different";
    EXPECT_THROW(receiver_->on_chunk(meta_for("/store/v", changed), frames(changed, 100)[0]),
                 PermanentError);
    EXPECT_EQ(0u, receiver_->active_uploads());
    EXPECT_TRUE(tmp_area_empty());

    EXPECT_EQ("version one", read_file(stored_path("/store/v")));
    auto rec = catalog_->records(TransferRequest{});
    ASSERT_EQ(1u, rec.size());
    EXPECT_EQ(sha256_of("version one"), rec[0].hash);
    EXPECT_EQ(rec[0].hash, file_io::sha256_file(rec[0].pfn));
}

TEST_F(T_UploadReceiver, SameContentAgainCompletes) {
    std::string content = random_bytes(5000, 13);
    ASSERT_EQ(UploadStatus::COMPLETE, push(*receiver_, "/store/twice", content));
    EXPECT_EQ(UploadStatus::COMPLETE, push(*receiver_, "/store/twice", content));

    EXPECT_EQ(content, read_file(stored_path("/store/twice")));
    EXPECT_EQ(1u, catalog_->records(TransferRequest{}).size());
    EXPECT_TRUE(tmp_area_empty());
}

TEST_F(T_UploadReceiver, SameNameInTwoBlocks) {
    std::string one = "first block";
    std::string two = "second block, longer";
    UploadMeta m1 = meta_for("/store/dup", one);
    UploadMeta m2 = meta_for("/store/dup", two);
    m2.block = "/d/U#2";
    EXPECT_EQ(UploadStatus::COMPLETE, receiver_->on_chunk(m1, frames(one, 100)[0]));
    EXPECT_EQ(UploadStatus::COMPLETE, receiver_->on_chunk(m2, frames(two, 100)[0]));

    auto rec = catalog_->records(TransferRequest{});
    ASSERT_EQ(2u, rec.size());
    EXPECT_NE(rec[0].pfn, rec[1].pfn);
    for (auto& e : rec) EXPECT_EQ(e.hash, file_io::sha256_file(e.pfn)) << e.to_string();
}
