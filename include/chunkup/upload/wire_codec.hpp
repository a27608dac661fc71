#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/upload/types.hpp"

#include <nlohmann/json.hpp>

namespace chunkup::upload {

/**
 * JSON bodies exchanged with the upload server. Decoders report a
 * malformed document as ProtocolError.
 */

nlohmann::json initialize_request_to_json(const InitializeRequest& request);
Result<InitializeRequest> initialize_request_from_json(const nlohmann::json& j);

nlohmann::json initialize_response_to_json(const InitializeResponse& response);
Result<InitializeResponse> initialize_response_from_json(const nlohmann::json& j);

nlohmann::json put_chunk_response_to_json(const PutChunkResponse& response);
Result<PutChunkResponse> put_chunk_response_from_json(const nlohmann::json& j);

nlohmann::json remote_status_to_json(const RemoteStatus& status);
Result<RemoteStatus> remote_status_from_json(const nlohmann::json& j);

nlohmann::json finalize_result_to_json(const FinalizeResult& result);
Result<FinalizeResult> finalize_result_from_json(const nlohmann::json& j);

} // namespace chunkup::upload
