#include "chunkup/core/hash.hpp"
#include "chunkup/upload/finalizer.hpp"

#include "../local_server.hpp"
#include "../test_support.hpp"

#include <gtest/gtest.h>

using namespace chunkup;
using namespace chunkup::upload;
using chunkup::testing::FaultInjectingApi;
using chunkup::testing::LocalServer;
using chunkup::testing::make_bytes;
using chunkup::testing::read_file;

namespace {

RetryPolicy fast_retry(std::uint32_t attempts) {
    RetryPolicy retry;
    retry.max_attempts = attempts;
    retry.initial_backoff = std::chrono::milliseconds{1};
    retry.max_backoff = std::chrono::milliseconds{2};
    return retry;
}

class FinalizerTest : public ::testing::Test {
protected:
    void open(bool with_hash) {
        data_ = make_bytes(2500, 4);
        FileDescriptor file;
        file.name = "final.bin";
        file.total_size_bytes = data_.size();
        if (with_hash) {
            file.content_hash = sha256_hex(data_).value();
        }

        InitializeRequest request;
        request.file = file;
        request.chunk_size = 1000;
        auto init = local_.api.initialize(request);
        ASSERT_TRUE(init.is_ok());

        session_ = std::make_shared<UploadSession>(init.value().session_id, file, 1000, init.value().total_chunks);
    }

    void upload_all() {
        for (ChunkIndex i = 0; i < session_->total_chunks(); ++i) {
            const std::size_t begin = i * 1000;
            const std::size_t end = std::min<std::size_t>(begin + 1000, data_.size());
            std::vector<std::uint8_t> chunk(data_.begin() + begin, data_.begin() + end);
            ASSERT_TRUE(local_.api.put_chunk(session_->session_id(), i, chunk, std::chrono::milliseconds{100}).is_ok());
            ASSERT_TRUE(session_->record_chunk(i).is_ok());
        }
    }

    LocalServer local_;
    FaultInjectingApi api_{local_.api};
    std::vector<std::uint8_t> data_;
    std::shared_ptr<UploadSession> session_;
};

} // namespace

TEST_F(FinalizerTest, AssemblesByteIdenticalArtifact) {
    open(true);
    upload_all();

    Finalizer finalizer(api_, fast_retry(3));
    auto result = finalizer.finalize(*session_);

    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value().total_bytes.value_or(0), 2500u);
    EXPECT_EQ(result.value().content_hash, *session_->file().content_hash);

    auto path = local_.server.artifact_path(result.value().artifact_id);
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->filename().string(), "final.bin");
    EXPECT_EQ(read_file(*path), data_);
}

TEST_F(FinalizerTest, RefusesIncompleteCoverage) {
    open(false);
    ASSERT_TRUE(session_->record_chunk(0).is_ok());

    Finalizer finalizer(api_, fast_retry(3));
    auto result = finalizer.finalize(*session_);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidState);
    EXPECT_EQ(api_.finalize_calls(), 0u);
}

TEST_F(FinalizerTest, RepeatedFinalizeReturnsSameArtifact) {
    open(true);
    upload_all();

    Finalizer finalizer(api_, fast_retry(3));
    auto first = finalizer.finalize(*session_);
    auto second = finalizer.finalize(*session_);

    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value().artifact_id, second.value().artifact_id);
    EXPECT_EQ(local_.server.metrics().artifacts_assembled, 1u);
}

TEST_F(FinalizerTest, RetriesTransientFailure) {
    open(false);
    upload_all();
    api_.fail_finalize(2);

    Finalizer finalizer(api_, fast_retry(3));
    auto result = finalizer.finalize(*session_);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(api_.finalize_calls(), 3u);
}

TEST_F(FinalizerTest, TransientFailureBeyondBudgetIsReturned) {
    open(false);
    upload_all();
    api_.fail_finalize(5);

    Finalizer finalizer(api_, fast_retry(2));
    auto result = finalizer.finalize(*session_);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Transient);
    EXPECT_EQ(api_.finalize_calls(), 2u);
}

TEST_F(FinalizerTest, ServerSideHashMismatchFailsAssembly) {
    data_ = make_bytes(2500, 4);
    FileDescriptor file;
    file.name = "wrong.bin";
    file.total_size_bytes = data_.size();
    file.content_hash = "0000000000000000";

    InitializeRequest request;
    request.file = file;
    request.chunk_size = 1000;
    auto init = local_.api.initialize(request);
    ASSERT_TRUE(init.is_ok());
    session_ = std::make_shared<UploadSession>(init.value().session_id, file, 1000, init.value().total_chunks);
    upload_all();

    Finalizer finalizer(api_, fast_retry(3));
    auto result = finalizer.finalize(*session_);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::AssemblyFailed);
    EXPECT_EQ(api_.finalize_calls(), 1u);

    auto status = local_.server.status(session_->session_id());
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().state, RemoteSessionState::Failed);
}
