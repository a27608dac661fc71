#include "chunkup/server/chunk_staging.hpp"
#include "chunkup/core/hash.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdio>
#include <fstream>

namespace chunkup::server {
namespace fs = std::filesystem;

namespace {

std::atomic<std::uint64_t> temp_counter{0};

} // namespace

ChunkStaging::ChunkStaging(fs::path staging_root) : staging_root_(std::move(staging_root)) {
    std::error_code ec;
    fs::create_directories(staging_root_, ec);
    if (ec) {
        spdlog::warn("Could not create staging root {}: {}", staging_root_.string(), ec.message());
    }
}

fs::path ChunkStaging::chunk_path(const std::string& session_id, std::uint32_t index) const {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%06u.part", index);
    return staging_root_ / session_id / name;
}

ServerResult<void> ChunkStaging::write_chunk(const std::string& session_id,
                                             std::uint32_t index,
                                             const std::vector<std::uint8_t>& data) const {
    const auto target = chunk_path(session_id, index);
    if (auto res = ensure_parent_exists(target); res.is_error()) {
        return res;
    }

    // Concurrent re-sends of one index each get their own temp file
    auto temp = target;
    temp += ".tmp" + std::to_string(++temp_counter);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return server_fail<void>(ServerErrorCode::Internal, "Failed to create " + temp.string());
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            return server_fail<void>(ServerErrorCode::Internal, "Failed to write " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        return server_fail<void>(ServerErrorCode::Internal, "Failed to commit chunk " + std::to_string(index));
    }
    return server_ok();
}

ServerResult<AssembledFile> ChunkStaging::assemble(const std::string& session_id,
                                                   std::uint32_t total_chunks,
                                                   const fs::path& destination) const {
    if (auto res = ensure_parent_exists(destination); res.is_error()) {
        return Err<AssembledFile>(res.error());
    }

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        return server_fail<AssembledFile>(ServerErrorCode::Internal, "Failed to create " + destination.string());
    }

    Sha256 digest;
    AssembledFile assembled;
    char buffer[64 * 1024];

    for (std::uint32_t index = 0; index < total_chunks; ++index) {
        const auto path = chunk_path(session_id, index);
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return server_fail<AssembledFile>(ServerErrorCode::Internal,
                                              "Staged chunk " + std::to_string(index) + " is missing");
        }
        while (in.read(buffer, sizeof(buffer)) || in.gcount() > 0) {
            const auto count = in.gcount();
            auto hashed = digest.update(reinterpret_cast<const std::uint8_t*>(buffer), static_cast<std::size_t>(count));
            if (hashed.is_error()) {
                return server_fail<AssembledFile>(ServerErrorCode::Internal, hashed.error().message);
            }
            out.write(buffer, count);
            assembled.total_bytes += static_cast<std::uint64_t>(count);
        }
    }

    out.flush();
    if (!out) {
        return server_fail<AssembledFile>(ServerErrorCode::Internal, "Failed to write " + destination.string());
    }
    auto content_hash = digest.hex();
    if (content_hash.is_error()) {
        return server_fail<AssembledFile>(ServerErrorCode::Internal, content_hash.error().message);
    }
    assembled.content_hash = content_hash.value();
    return server_ok(std::move(assembled));
}

void ChunkStaging::remove_session(const std::string& session_id) const {
    std::error_code ec;
    fs::remove_all(staging_root_ / session_id, ec);
    if (ec) {
        spdlog::warn("Failed to remove staging for {}: {}", session_id, ec.message());
    }
}

bool ChunkStaging::has_session(const std::string& session_id) const {
    std::error_code ec;
    return fs::exists(staging_root_ / session_id, ec);
}

ServerResult<void> ChunkStaging::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::exists(parent)) {
        return server_fail<void>(ServerErrorCode::Internal, "Failed to create directory: " + parent.string());
    }
    return server_ok();
}

} // namespace chunkup::server
