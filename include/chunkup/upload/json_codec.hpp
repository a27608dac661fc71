#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/upload/session.hpp"
#include "chunkup/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>

namespace chunkup::upload {

using json = nlohmann::json;

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms);

json file_descriptor_to_json(const FileDescriptor& file);
FileDescriptor file_descriptor_from_json(const json& j);

json options_to_json(const UploadOptions& options);

/// Fields missing from @p j keep the value they have in @p defaults
Result<UploadOptions> options_from_json(const json& j, UploadOptions defaults = {});

json snapshot_to_json(const UploadSession::Snapshot& snapshot);
Result<UploadSession::Snapshot> snapshot_from_json(const json& j);

} // namespace chunkup::upload
