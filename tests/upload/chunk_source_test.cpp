#include "chunkup/upload/chunk_source.hpp"

#include "../test_support.hpp"

#include <gtest/gtest.h>

using namespace chunkup;
using namespace chunkup::upload;
using chunkup::testing::TempDir;
using chunkup::testing::make_bytes;

TEST(ChunkSourceTest, RangesCoverTheFile) {
    auto bytes = std::make_shared<MemoryByteSource>(make_bytes(2500));
    auto source = ChunkSource::create(bytes, 1000);
    ASSERT_TRUE(source.is_ok());

    EXPECT_EQ(source.value().chunk_count(), 3u);

    auto last = source.value().range(2);
    ASSERT_TRUE(last.is_ok());
    EXPECT_EQ(last.value().bytes.offset, 2000u);
    EXPECT_EQ(last.value().bytes.length, 500u);

    EXPECT_TRUE(source.value().range(3).is_error());
}

TEST(ChunkSourceTest, ZeroChunkSizeIsRejected) {
    auto bytes = std::make_shared<MemoryByteSource>(make_bytes(10));
    auto source = ChunkSource::create(bytes, 0);
    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error().code, ErrorCode::InvalidState);
}

TEST(ChunkSourceTest, ReadReturnsExactBytes) {
    auto data = make_bytes(2500, 9);
    auto source = ChunkSource::create(std::make_shared<MemoryByteSource>(data), 1000);
    ASSERT_TRUE(source.is_ok());

    auto chunk = source.value().read(1);
    ASSERT_TRUE(chunk.is_ok());
    EXPECT_EQ(chunk.value(), std::vector<std::uint8_t>(data.begin() + 1000, data.begin() + 2000));
}

TEST(ChunkSourceTest, CursorWalksInOrderAndRestarts) {
    auto source = ChunkSource::create(std::make_shared<MemoryByteSource>(make_bytes(25)), 10);
    ASSERT_TRUE(source.is_ok());

    auto cursor = source.value().cursor();
    std::vector<ChunkIndex> seen;
    while (auto range = cursor.next()) {
        seen.push_back(range->index);
    }
    EXPECT_EQ(seen, (std::vector<ChunkIndex>{0, 1, 2}));

    cursor.reset();
    ASSERT_TRUE(cursor.next().has_value());
}

TEST(ChunkSourceTest, FileSourceReadsRanges) {
    TempDir dir;
    auto data = make_bytes(4096, 2);
    chunkup::testing::write_file(dir / "input.bin", data);

    auto file = FileByteSource::open(dir / "input.bin");
    ASSERT_TRUE(file.is_ok());
    EXPECT_EQ(file.value()->size(), 4096u);

    auto source = ChunkSource::create(file.value(), 1024);
    ASSERT_TRUE(source.is_ok());
    auto chunk = source.value().read(3);
    ASSERT_TRUE(chunk.is_ok());
    EXPECT_EQ(chunk.value(), std::vector<std::uint8_t>(data.begin() + 3072, data.end()));
}

TEST(ChunkSourceTest, MissingFileIsIoError) {
    TempDir dir;
    auto file = FileByteSource::open(dir / "missing.bin");
    ASSERT_TRUE(file.is_error());
    EXPECT_EQ(file.error().code, ErrorCode::IoError);
}

TEST(ChunkSourceTest, TruncatedFileFailsRead) {
    TempDir dir;
    chunkup::testing::write_file(dir / "input.bin", make_bytes(100));

    FileByteSource stale(dir / "input.bin", 200);
    auto read = stale.read(100, 100);
    ASSERT_TRUE(read.is_error());
    EXPECT_EQ(read.error().code, ErrorCode::IoError);
}
