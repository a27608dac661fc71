#include "chunkup/upload/session_store.hpp"

#include "../test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <thread>

using namespace chunkup;
using namespace chunkup::upload;
using chunkup::testing::TempDir;
using chunkup::testing::make_bytes;
using chunkup::testing::write_file;

namespace {

SessionEntry make_entry(const std::string& id, std::shared_ptr<const ChunkSource> source = nullptr) {
    FileDescriptor file;
    file.name = "data.bin";
    file.total_size_bytes = 2500;
    SessionEntry entry;
    entry.session = std::make_shared<UploadSession>(id, file, 1000, 3);
    entry.source = std::move(source);
    return entry;
}

} // namespace

TEST(SessionStoreTest, InMemoryCreateAndGet) {
    SessionStore store;
    EXPECT_FALSE(store.has_journal());
    ASSERT_TRUE(store.create(make_entry("s-1")).is_ok());

    auto found = store.get("s-1");
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value().session->session_id(), "s-1");

    auto missing = store.get("s-2");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::InvalidState);
}

TEST(SessionStoreTest, DuplicateIdIsRejected) {
    SessionStore store;
    ASSERT_TRUE(store.create(make_entry("s-1")).is_ok());
    auto again = store.create(make_entry("s-1"));
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);
}

TEST(SessionStoreTest, EvictRemovesSession) {
    SessionStore store;
    ASSERT_TRUE(store.create(make_entry("s-1")).is_ok());
    EXPECT_TRUE(store.evict("s-1"));
    EXPECT_FALSE(store.evict("s-1"));
    EXPECT_TRUE(store.list().empty());
}

TEST(SessionStoreTest, JournalRestoresProgressAndSource) {
    TempDir dir;
    const auto file_path = dir / "data.bin";
    write_file(file_path, make_bytes(2500));

    {
        SessionStore store(dir / "journal");
        SessionEntry entry = make_entry("s-1");
        entry.source_path = file_path;
        entry.options.scheduler.worker_count = 7;
        ASSERT_TRUE(store.create(entry).is_ok());
        ASSERT_TRUE(entry.session->transition_to(UploadStatus::Uploading).is_ok());
        ASSERT_TRUE(entry.session->record_chunk(0).is_ok());
        ASSERT_TRUE(entry.session->record_chunk(2).is_ok());
        ASSERT_TRUE(entry.session->transition_to(UploadStatus::Resuming).is_ok());
        ASSERT_TRUE(store.persist("s-1").is_ok());
    }

    SessionStore reopened(dir / "journal");
    EXPECT_EQ(reopened.list(), std::vector<std::string>({"s-1"}));

    auto restored = reopened.get("s-1");
    ASSERT_TRUE(restored.is_ok()) << restored.error().message;
    const auto& entry = restored.value();
    EXPECT_EQ(entry.session->status(), UploadStatus::Resuming);
    EXPECT_EQ(entry.session->uploaded_chunks(), std::vector<ChunkIndex>({0, 2}));
    EXPECT_EQ(entry.options.scheduler.worker_count, 7u);
    ASSERT_TRUE(entry.source);
    EXPECT_EQ(entry.source->chunk_count(), 3u);
}

TEST(SessionStoreTest, ChangedSourceFileIsRefused) {
    TempDir dir;
    const auto file_path = dir / "data.bin";
    write_file(file_path, make_bytes(2500));

    {
        SessionStore store(dir / "journal");
        SessionEntry entry = make_entry("s-1");
        entry.source_path = file_path;
        ASSERT_TRUE(store.create(entry).is_ok());
    }

    write_file(file_path, make_bytes(100));

    SessionStore reopened(dir / "journal");
    auto restored = reopened.get("s-1");
    ASSERT_TRUE(restored.is_error());
    EXPECT_EQ(restored.error().code, ErrorCode::InvalidState);
}

TEST(SessionStoreTest, CorruptJournalIsProtocolError) {
    TempDir dir;
    SessionStore store(dir / "journal");
    {
        std::ofstream out(dir.path() / "journal" / "s-9.json");
        out << "{ not json";
    }

    auto restored = store.get("s-9");
    ASSERT_TRUE(restored.is_error());
    EXPECT_EQ(restored.error().code, ErrorCode::ProtocolError);
}

TEST(SessionStoreTest, TerminalSessionLeavesJournal) {
    TempDir dir;
    SessionStore store(dir / "journal");
    SessionEntry entry = make_entry("s-1");
    ASSERT_TRUE(store.create(entry).is_ok());
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "journal" / "s-1.json"));

    ASSERT_TRUE(entry.session->mark_cancelled().is_ok());
    ASSERT_TRUE(store.persist("s-1").is_ok());

    EXPECT_FALSE(std::filesystem::exists(dir.path() / "journal" / "s-1.json"));
    // Still reachable in memory until evicted
    EXPECT_TRUE(store.get("s-1").is_ok());
}

TEST(SessionStoreTest, PersistAfterCancelDoesNotRestoreJournal) {
    TempDir dir;
    SessionStore store(dir / "journal");
    SessionEntry entry = make_entry("s-1");
    ASSERT_TRUE(store.create(entry).is_ok());

    ASSERT_TRUE(entry.session->mark_cancelled().is_ok());
    store.forget("s-1");
    // A worker that finished its chunk after the cancel still persists
    ASSERT_TRUE(store.persist("s-1").is_ok());

    EXPECT_FALSE(std::filesystem::exists(dir.path() / "journal" / "s-1.json"));
    SessionStore reopened(dir / "journal");
    EXPECT_TRUE(reopened.list().empty());
}

TEST(SessionStoreTest, ConcurrentPersistCannotOutliveCancel) {
    TempDir dir;
    SessionStore store(dir / "journal");
    SessionEntry entry = make_entry("s-1");
    entry.session = std::make_shared<UploadSession>("s-1", entry.session->file(), 10, 250);
    ASSERT_TRUE(store.create(entry).is_ok());
    ASSERT_TRUE(entry.session->transition_to(UploadStatus::Uploading).is_ok());

    std::atomic<bool> done{false};
    std::thread writer([&]() {
        for (ChunkIndex index = 0; index < 250 && !done.load(); ++index) {
            auto recorded = entry.session->record_chunk(index);
            if (recorded.is_error()) {
                EXPECT_EQ(entry.session->status(), UploadStatus::Cancelled);
            }
            EXPECT_TRUE(store.persist("s-1").is_ok());
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds{2});
    ASSERT_TRUE(entry.session->mark_cancelled().is_ok());
    store.forget("s-1");
    done = true;
    writer.join();

    EXPECT_FALSE(std::filesystem::exists(dir.path() / "journal" / "s-1.json"));
    SessionStore reopened(dir / "journal");
    EXPECT_TRUE(reopened.list().empty());
}
