#include "chunkup/upload/transmission_worker.hpp"
#include "chunkup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace chunkup::upload {
namespace {

Error permanent(ChunkIndex index, std::string message) {
    return make_chunk_error(ErrorCode::ChunkPermanentError, index, std::move(message));
}

Error with_chunk(Error error, ChunkIndex index) {
    error.chunk_index = index;
    return error;
}

} // namespace

TransmissionWorker::TransmissionWorker(UploadApi& api,
                                       const ChunkSource& source,
                                       RetryPolicy retry,
                                       std::chrono::milliseconds attempt_timeout,
                                       events::EventBus* bus)
    : api_(api),
      source_(source),
      retry_(retry),
      attempt_timeout_(attempt_timeout),
      bus_(bus) {}

Result<ChunkAck> TransmissionWorker::send(const std::string& session_id,
                                          const ChunkRange& chunk,
                                          const CancellationToken* cancel) const {
    if (cancel && cancel->is_cancelled()) {
        return Err<ChunkAck>(with_chunk(stop_error(*cancel), chunk.index));
    }

    auto payload = source_.read(chunk);
    if (payload.is_error()) {
        return Err<ChunkAck>(permanent(chunk.index, "Failed to read chunk: " + payload.error().message));
    }

    const std::uint32_t max_attempts = std::max<std::uint32_t>(1, retry_.max_attempts);
    Error last_error = make_error(ErrorCode::Transient, "no attempt made");

    for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        auto response = api_.put_chunk(session_id, chunk.index, payload.value(), attempt_timeout_);

        if (response.is_ok()) {
            const auto& body = response.value();
            if (body.index && *body.index != chunk.index) {
                return Err<ChunkAck>(permanent(chunk.index, "Server acknowledged chunk "
                                               + std::to_string(*body.index) + " instead"));
            }
            return Ok(ChunkAck{chunk.index, body.status, attempt});
        }

        last_error = response.error();
        switch (last_error.code) {
            case ErrorCode::Transient:
            case ErrorCode::ChunkTransientError:
                break;
            case ErrorCode::SessionExpired:
                return Err<ChunkAck>(with_chunk(last_error, chunk.index));
            default:
                return Err<ChunkAck>(permanent(chunk.index, std::string(to_string(last_error.code))
                                               + ": " + last_error.message));
        }

        if (attempt == max_attempts) {
            break;
        }

        const auto delay = retry_.delay_for(attempt);
        spdlog::debug("Chunk {} of {} attempt {} failed ({}), retrying in {}ms",
                      chunk.index, session_id, attempt, last_error.message, delay.count());
        if (bus_) {
            bus_->emit(events::ChunkRetryEvent{session_id, chunk.index, attempt, delay, last_error.message});
        }

        if (cancel) {
            if (!cancel->wait_for(delay)) {
                return Err<ChunkAck>(with_chunk(stop_error(*cancel), chunk.index));
            }
        } else {
            std::this_thread::sleep_for(delay);
        }
    }

    return Err<ChunkAck>(permanent(chunk.index, "Gave up after " + std::to_string(max_attempts)
                                   + " attempts: " + last_error.message));
}

} // namespace chunkup::upload
