// ============================================================
// t_file_io.cpp -- Storage layout and memory-mapped writes
// ============================================================

#include <gtest/gtest.h>

#include "testutil.hpp"
#include "../common/file_io.hpp"
#include <stdexcept>

TEST(T_FileIo, BlockDirSeparatesBlocks) {
    std::string a1 = file_io::block_dir("/d/A", "/d/A#1");
    EXPECT_EQ(16u, a1.size());
    EXPECT_EQ(std::string::npos, a1.find_first_not_of("0123456789abcdef"));
    EXPECT_EQ(a1, file_io::block_dir("/d/A", "/d/A#1"));
    EXPECT_NE(a1, file_io::block_dir("/d/A", "/d/A#2"));
    EXPECT_NE(a1, file_io::block_dir("/d/B", "/d/A#1"));
}

TEST(T_FileIo, StoragePath) {
    fs::path p = file_io::storage_path("/srv/storage", "/d/A", "/d/A#1", "/store/x.root");
    EXPECT_EQ(fs::path("/srv/storage") / file_io::block_dir("/d/A", "/d/A#1") / "store" / "x.root",
              p);
    EXPECT_NE(p, file_io::storage_path("/srv/storage", "/d/A", "/d/A#2", "/store/x.root"));

    EXPECT_THROW(file_io::storage_path("/srv/storage", "/d/A", "/d/A#1", "/../../etc/passwd"),
                 std::runtime_error);
    EXPECT_THROW(file_io::storage_path("/srv/storage", "", "/d/A#1", "/store/x"),
                 std::runtime_error);
    EXPECT_THROW(file_io::storage_path("/srv/storage", "/d/A", "", "/store/x"),
                 std::runtime_error);
}

TEST(T_FileIo, WriterRoundTrip) {
    TempDir dir;
    std::string path = dir.file("sub/out.bin");
    std::string data = random_bytes(10000, 21);

    file_io::MmapWriter w;
    w.open(path, data.size());
    w.write_at(5000, data.data() + 5000, 5000);
    w.write_at(0, data.data(), 5000);
    EXPECT_THROW(w.write_at(9999, data.data(), 2), std::runtime_error);
    w.close();

    EXPECT_EQ(data, read_file(path));
    EXPECT_EQ(data.size(), file_io::get_file_size(path));
    EXPECT_EQ(sha256_of(data), file_io::sha256_file(path));
}

TEST(T_FileIo, FailedOpenRemovesFile) {
    TempDir dir;
    std::string path = dir.file("huge.part");

    file_io::MmapWriter w;
    EXPECT_THROW(w.open(path, 1ull << 62), std::runtime_error);
    EXPECT_FALSE(w.is_open());
    EXPECT_FALSE(fs::exists(path));
}
