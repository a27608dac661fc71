#include "chunkup/upload/session_store.hpp"
#include "chunkup/upload/json_codec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <set>

namespace chunkup::upload {

namespace fs = std::filesystem;

SessionStore::SessionStore(fs::path journal_dir) : journal_dir_(std::move(journal_dir)) {
    std::error_code ec;
    fs::create_directories(*journal_dir_, ec);
    if (ec) {
        spdlog::warn("Could not create journal directory {}: {}", journal_dir_->string(), ec.message());
    }
}

Result<void> SessionStore::create(SessionEntry entry) {
    if (!entry.session) {
        return Err<void>(make_error(ErrorCode::InvalidState, "Session entry has no session"));
    }
    const std::string id = entry.session->session_id();
    {
        std::lock_guard lock(mutex_);
        if (entries_.count(id) > 0) {
            return Err<void>(make_error(ErrorCode::InvalidState, "Session already registered: " + id));
        }
        entries_.emplace(id, entry);
    }
    if (journal_dir_) {
        std::lock_guard journal(journal_mutex_);
        return write_journal(entry);
    }
    return Ok();
}

Result<SessionEntry> SessionStore::get(const std::string& session_id) {
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(session_id);
        if (it != entries_.end()) {
            return Ok(it->second);
        }
    }

    if (!journal_dir_) {
        return Fail<SessionEntry>(ErrorCode::InvalidState, "Unknown session: " + session_id);
    }

    auto loaded = load_journal(session_id);
    if (loaded.is_error()) {
        return loaded;
    }

    std::lock_guard lock(mutex_);
    // Another thread may have restored it meanwhile; keep the first copy
    auto [it, inserted] = entries_.emplace(session_id, std::move(loaded.value()));
    if (inserted) {
        spdlog::info("Restored session {} from journal ({}/{} chunks)", session_id,
                     it->second.session->uploaded_count(), it->second.session->total_chunks());
    }
    return Ok(it->second);
}

bool SessionStore::evict(const std::string& session_id) {
    bool known = false;
    {
        std::lock_guard lock(mutex_);
        known = entries_.erase(session_id) > 0;
    }
    if (journal_dir_) {
        std::lock_guard journal(journal_mutex_);
        std::error_code ec;
        known = fs::remove(journal_path(session_id), ec) || known;
    }
    return known;
}

std::vector<std::string> SessionStore::list() const {
    std::set<std::string> ids;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            ids.insert(id);
        }
    }
    if (journal_dir_) {
        std::error_code ec;
        for (fs::directory_iterator it(*journal_dir_, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->path().extension() == ".json") {
                ids.insert(it->path().stem().string());
            }
        }
    }
    return {ids.begin(), ids.end()};
}

Result<void> SessionStore::persist(const std::string& session_id) {
    SessionEntry entry;
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(session_id);
        if (it == entries_.end()) {
            return Err<void>(make_error(ErrorCode::InvalidState, "Unknown session: " + session_id));
        }
        entry = it->second;
    }
    if (!journal_dir_) {
        return Ok();
    }
    // Status is read under the journal lock: a status change followed by
    // forget() can no longer be overtaken by an older write
    std::lock_guard journal(journal_mutex_);
    if (is_terminal(entry.session->status())) {
        remove_journal(session_id);
        return Ok();
    }
    return write_journal(entry);
}

void SessionStore::forget(const std::string& session_id) {
    if (!journal_dir_) {
        return;
    }
    std::lock_guard journal(journal_mutex_);
    remove_journal(session_id);
}

void SessionStore::remove_journal(const std::string& session_id) const {
    std::error_code ec;
    fs::remove(journal_path(session_id), ec);
    if (ec) {
        spdlog::warn("Failed to remove journal for {}: {}", session_id, ec.message());
    }
}

fs::path SessionStore::journal_path(const std::string& session_id) const {
    return *journal_dir_ / (session_id + ".json");
}

Result<void> SessionStore::write_journal(const SessionEntry& entry) const {
    const auto& id = entry.session->session_id();

    json j;
    j["session"] = snapshot_to_json(entry.session->snapshot());
    j["options"] = options_to_json(entry.options);
    if (entry.source_path) {
        j["source_path"] = entry.source_path->string();
    }

    const auto target = journal_path(id);
    auto temp = target;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Err<void>(make_error(ErrorCode::IoError, "Failed to open journal " + temp.string()));
        }
        out << j.dump(2);
        if (!out) {
            return Err<void>(make_error(ErrorCode::IoError, "Failed to write journal " + temp.string()));
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        return Err<void>(make_error(ErrorCode::IoError, "Failed to commit journal for " + id + ": " + ec.message()));
    }
    return Ok();
}

Result<SessionEntry> SessionStore::load_journal(const std::string& session_id) const {
    const auto path = journal_path(session_id);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Fail<SessionEntry>(ErrorCode::InvalidState, "Unknown session: " + session_id);
    }

    auto j = json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("session")) {
        return Fail<SessionEntry>(ErrorCode::ProtocolError, "Corrupt journal " + path.string());
    }

    auto snapshot = snapshot_from_json(j["session"]);
    if (snapshot.is_error()) {
        return Err<SessionEntry>(snapshot.error());
    }
    auto session = UploadSession::restore(snapshot.value());
    if (session.is_error()) {
        return Err<SessionEntry>(session.error());
    }

    SessionEntry entry;
    entry.session = session.value();

    auto options = options_from_json(j.value("options", json::object()));
    if (options.is_error()) {
        return Err<SessionEntry>(options.error());
    }
    entry.options = options.value();

    if (j.contains("source_path") && j["source_path"].is_string()) {
        entry.source_path = fs::path(j["source_path"].get<std::string>());
        auto bytes = FileByteSource::open(*entry.source_path);
        if (bytes.is_error()) {
            return Err<SessionEntry>(bytes.error());
        }
        if (bytes.value()->size() != entry.session->file().total_size_bytes) {
            return Fail<SessionEntry>(ErrorCode::InvalidState,
                                      "Source " + entry.source_path->string() + " changed size since session "
                                      + session_id + " was created; start a new session");
        }
        auto chunks = ChunkSource::create(bytes.value(), entry.session->chunk_size());
        if (chunks.is_error()) {
            return Err<SessionEntry>(chunks.error());
        }
        entry.source = std::make_shared<const ChunkSource>(std::move(chunks.value()));
    }
    return Ok(std::move(entry));
}

} // namespace chunkup::upload
