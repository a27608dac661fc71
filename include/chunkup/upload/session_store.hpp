#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/upload/chunk_source.hpp"
#include "chunkup/upload/session.hpp"
#include "chunkup/upload/types.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkup::upload {

/**
 * @brief Everything the coordinator needs to drive one session
 */
struct SessionEntry {
    std::shared_ptr<UploadSession> session;
    std::shared_ptr<const ChunkSource> source;     ///< Null for a restored session without a file path
    UploadOptions options;
    std::optional<std::filesystem::path> source_path;
};

/**
 * @brief Registry of client sessions, optionally backed by a JSON journal
 *
 * Without a journal directory the store is purely in-memory. With one,
 * persist() writes <journal_dir>/<session_id>.json (temp file + rename)
 * and get() falls back to the journal for sessions this process has not
 * seen, re-opening the source file and checking its size still matches.
 *
 * Terminal sessions are dropped from the journal but stay in memory until
 * evict(). Journal writes and removals are serialized, and persist() checks
 * the status under that lock, so once a session is terminal and forgotten
 * no later persist() can bring its journal back.
 */
class SessionStore {
public:
    SessionStore() = default;
    explicit SessionStore(std::filesystem::path journal_dir);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    Result<void> create(SessionEntry entry);

    Result<SessionEntry> get(const std::string& session_id);

    /// Remove from memory and journal; false if the session was unknown
    bool evict(const std::string& session_id);

    /// In-memory and journaled session ids, sorted
    [[nodiscard]] std::vector<std::string> list() const;

    Result<void> persist(const std::string& session_id);

    void forget(const std::string& session_id);

    [[nodiscard]] bool has_journal() const noexcept { return journal_dir_.has_value(); }

private:
    [[nodiscard]] std::filesystem::path journal_path(const std::string& session_id) const;
    Result<void> write_journal(const SessionEntry& entry) const;
    Result<SessionEntry> load_journal(const std::string& session_id) const;
    void remove_journal(const std::string& session_id) const;

    std::optional<std::filesystem::path> journal_dir_;
    mutable std::mutex mutex_;
    std::mutex journal_mutex_;  ///< Orders journal writes and removals
    std::unordered_map<std::string, SessionEntry> entries_;
};

} // namespace chunkup::upload
