#pragma once

#include "chunkup/server/server_error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chunkup::server {

struct AssembledFile {
    std::uint64_t total_bytes = 0;
    std::string content_hash;
};

/**
 * @brief On-disk chunk storage for sessions that have not been assembled
 *
 * Layout: <staging_root>/<session_id>/chunk_NNNNNN.part. A chunk file only
 * appears once its bytes are fully written (temp file + rename), so a
 * crash mid-write never leaves a truncated chunk behind.
 */
class ChunkStaging {
public:
    explicit ChunkStaging(std::filesystem::path staging_root);

    ServerResult<void> write_chunk(const std::string& session_id,
                                   std::uint32_t index,
                                   const std::vector<std::uint8_t>& data) const;

    /// Concatenate chunks 0..total_chunks-1 into @p destination
    ServerResult<AssembledFile> assemble(const std::string& session_id,
                                         std::uint32_t total_chunks,
                                         const std::filesystem::path& destination) const;

    void remove_session(const std::string& session_id) const;

    [[nodiscard]] bool has_session(const std::string& session_id) const;

    [[nodiscard]] std::filesystem::path chunk_path(const std::string& session_id, std::uint32_t index) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return staging_root_; }

    static ServerResult<void> ensure_parent_exists(const std::filesystem::path& path);

private:
    std::filesystem::path staging_root_;
};

} // namespace chunkup::server
