#pragma once

#include "chunkup/upload/upload_api.hpp"
#include "chunkup/upload/wire_codec.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace chunkup::testing {

namespace fs = std::filesystem;

/// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "chunkup_test") {
        static std::atomic<std::uint64_t> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

/// Deterministic non-repeating-looking content
inline std::vector<std::uint8_t> make_bytes(std::size_t size, std::uint32_t seed = 1) {
    std::vector<std::uint8_t> data(size);
    std::uint32_t state = seed * 2654435761u + 1;
    for (auto& byte : data) {
        state = state * 1103515245u + 12345u;
        byte = static_cast<std::uint8_t>(state >> 16);
    }
    return data;
}

inline void write_file(const fs::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline std::vector<std::uint8_t> read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    const std::string text = oss.str();
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

/**
 * @brief UploadApi decorator that injects faults and measures concurrency
 *
 * - fail_chunk(index, times, code): the next @p times put_chunk calls for
 *   that index fail with @p code before reaching the inner api
 * - disconnect_after(n): only the first n put_chunk calls get through;
 *   later ones fail with Transient until reconnect()
 * - set_put_delay(d): every forwarded put_chunk sleeps for d first
 * - fail_finalize(times, code), fail_status(times, code)
 */
class FaultInjectingApi : public upload::UploadApi {
public:
    explicit FaultInjectingApi(upload::UploadApi& inner) : inner_(inner) {}

    void fail_chunk(upload::ChunkIndex index, std::uint32_t times, ErrorCode code = ErrorCode::Transient) {
        std::lock_guard lock(mutex_);
        chunk_faults_[index] = {times, code};
    }

    void disconnect_after(std::size_t puts) {
        admitted_.store(0);
        disconnect_limit_.store(static_cast<std::int64_t>(puts));
    }

    void reconnect() { disconnect_limit_.store(-1); }

    void set_put_delay(std::chrono::milliseconds delay) { put_delay_ = delay; }

    void fail_finalize(std::uint32_t times, ErrorCode code = ErrorCode::Transient) {
        std::lock_guard lock(mutex_);
        finalize_faults_ = {times, code};
    }

    void fail_status(std::uint32_t times, ErrorCode code = ErrorCode::Transient) {
        std::lock_guard lock(mutex_);
        status_faults_ = {times, code};
    }

    std::size_t peak_concurrency() const { return peak_.load(); }
    std::size_t put_calls() const { return put_calls_.load(); }
    std::size_t finalize_calls() const { return finalize_calls_.load(); }
    std::size_t cancel_calls() const { return cancel_calls_.load(); }

    /// Indices in the order put_chunk reached the inner api
    std::vector<upload::ChunkIndex> forwarded() const {
        std::lock_guard lock(mutex_);
        return forwarded_;
    }

    Result<upload::InitializeResponse> initialize(const upload::InitializeRequest& request) override {
        return inner_.initialize(request);
    }

    Result<upload::PutChunkResponse> put_chunk(const std::string& session_id,
                                               upload::ChunkIndex index,
                                               const std::vector<std::uint8_t>& payload,
                                               std::chrono::milliseconds timeout) override {
        ++put_calls_;
        const std::size_t now_active = ++active_;
        std::size_t seen = peak_.load();
        while (now_active > seen && !peak_.compare_exchange_weak(seen, now_active)) {
        }
        auto result = forward_put(session_id, index, payload, timeout);
        --active_;
        return result;
    }

    Result<upload::RemoteStatus> status(const std::string& session_id) override {
        if (auto fault = take(status_faults_)) {
            return Fail<upload::RemoteStatus>(*fault, "injected status failure");
        }
        return inner_.status(session_id);
    }

    Result<upload::FinalizeResult> finalize(const std::string& session_id) override {
        ++finalize_calls_;
        if (auto fault = take(finalize_faults_)) {
            return Fail<upload::FinalizeResult>(*fault, "injected finalize failure");
        }
        return inner_.finalize(session_id);
    }

    Result<void> cancel(const std::string& session_id) override {
        ++cancel_calls_;
        return inner_.cancel(session_id);
    }

private:
    struct Fault {
        std::uint32_t remaining = 0;
        ErrorCode code = ErrorCode::Transient;
    };

    std::optional<ErrorCode> take(Fault& fault) {
        std::lock_guard lock(mutex_);
        if (fault.remaining == 0) {
            return std::nullopt;
        }
        --fault.remaining;
        return fault.code;
    }

    Result<upload::PutChunkResponse> forward_put(const std::string& session_id,
                                                 upload::ChunkIndex index,
                                                 const std::vector<std::uint8_t>& payload,
                                                 std::chrono::milliseconds timeout) {
        {
            std::lock_guard lock(mutex_);
            auto it = chunk_faults_.find(index);
            if (it != chunk_faults_.end() && it->second.remaining > 0) {
                --it->second.remaining;
                return Fail<upload::PutChunkResponse>(it->second.code,
                    "injected failure for chunk " + std::to_string(index));
            }
        }

        const auto limit = disconnect_limit_.load();
        if (limit >= 0 && admitted_.fetch_add(1) >= static_cast<std::size_t>(limit)) {
            return Fail<upload::PutChunkResponse>(ErrorCode::Transient, "connection lost");
        }

        if (put_delay_.count() > 0) {
            std::this_thread::sleep_for(put_delay_);
        }
        {
            std::lock_guard lock(mutex_);
            forwarded_.push_back(index);
        }
        return inner_.put_chunk(session_id, index, payload, timeout);
    }

    upload::UploadApi& inner_;
    mutable std::mutex mutex_;
    std::map<upload::ChunkIndex, Fault> chunk_faults_;
    Fault finalize_faults_;
    Fault status_faults_;
    std::vector<upload::ChunkIndex> forwarded_;
    std::chrono::milliseconds put_delay_{0};
    std::atomic<std::int64_t> disconnect_limit_{-1};
    std::atomic<std::size_t> admitted_{0};
    std::atomic<std::size_t> active_{0};
    std::atomic<std::size_t> peak_{0};
    std::atomic<std::size_t> put_calls_{0};
    std::atomic<std::size_t> finalize_calls_{0};
    std::atomic<std::size_t> cancel_calls_{0};
};

/**
 * @brief Answers with the smallest reply bodies the HTTP contract allows
 *
 * Every reply from the inner api is re-encoded with only the required keys
 * and decoded through the wire codec, as a minimal server would answer.
 */
class MinimalReplyApi : public upload::UploadApi {
public:
    explicit MinimalReplyApi(upload::UploadApi& inner) : inner_(inner) {}

    Result<upload::InitializeResponse> initialize(const upload::InitializeRequest& request) override {
        return inner_.initialize(request);
    }

    Result<upload::PutChunkResponse> put_chunk(const std::string& session_id,
                                               upload::ChunkIndex index,
                                               const std::vector<std::uint8_t>& payload,
                                               std::chrono::milliseconds timeout) override {
        auto reply = inner_.put_chunk(session_id, index, payload, timeout);
        if (reply.is_error()) {
            return reply;
        }
        const bool duplicate = reply.value().status == upload::ChunkAckStatus::AlreadyAccepted;
        return upload::put_chunk_response_from_json(
            nlohmann::json{{"status", duplicate ? "already_accepted" : "accepted"}});
    }

    Result<upload::RemoteStatus> status(const std::string& session_id) override {
        auto reply = inner_.status(session_id);
        if (reply.is_error()) {
            return reply;
        }
        nlohmann::json body = {
            {"status", upload::to_string(reply.value().state)},
            {"total_chunks", reply.value().total_chunks},
            {"missing_chunks", reply.value().missing_chunks.value_or(std::vector<upload::ChunkIndex>{})}
        };
        return upload::remote_status_from_json(body);
    }

    Result<upload::FinalizeResult> finalize(const std::string& session_id) override {
        auto reply = inner_.finalize(session_id);
        if (reply.is_error()) {
            return reply;
        }
        return upload::finalize_result_from_json(nlohmann::json{{"artifact_id", reply.value().artifact_id}});
    }

    Result<void> cancel(const std::string& session_id) override {
        return inner_.cancel(session_id);
    }

private:
    upload::UploadApi& inner_;
};

} // namespace chunkup::testing
