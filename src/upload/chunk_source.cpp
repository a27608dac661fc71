#include "chunkup/upload/chunk_source.hpp"
#include "chunkup/upload/session.hpp"

#include <algorithm>
#include <fstream>
#include <limits>

namespace chunkup::upload {

// ════════════════════════════════════════════════════════
// Byte sources
// ════════════════════════════════════════════════════════

Result<std::shared_ptr<FileByteSource>> FileByteSource::open(const std::filesystem::path& path) {
    using SourcePtr = std::shared_ptr<FileByteSource>;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Fail<SourcePtr>(ErrorCode::IoError, "Not a regular file: " + path.string());
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return Fail<SourcePtr>(ErrorCode::IoError, "Failed to stat " + path.string() + ": " + ec.message());
    }
    return Ok(std::make_shared<FileByteSource>(path, static_cast<std::uint64_t>(size)));
}

FileByteSource::FileByteSource(std::filesystem::path path, std::uint64_t size)
    : path_(std::move(path)), size_(size) {}

Result<std::vector<std::uint8_t>> FileByteSource::read(std::uint64_t offset, std::uint64_t length) const {
    using Bytes = std::vector<std::uint8_t>;

    if (offset + length > size_) {
        return Fail<Bytes>(ErrorCode::IoError, "Read past end of " + path_.string());
    }

    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        return Fail<Bytes>(ErrorCode::IoError, "Failed to open " + path_.string());
    }
    input.seekg(static_cast<std::streamoff>(offset));

    Bytes buffer(static_cast<std::size_t>(length));
    input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::uint64_t>(input.gcount()) != length) {
        return Fail<Bytes>(ErrorCode::IoError, "Short read from " + path_.string()
                           + " at offset " + std::to_string(offset));
    }
    return Ok(std::move(buffer));
}

Result<std::vector<std::uint8_t>> MemoryByteSource::read(std::uint64_t offset, std::uint64_t length) const {
    using Bytes = std::vector<std::uint8_t>;

    if (offset + length > data_.size()) {
        return Fail<Bytes>(ErrorCode::IoError, "Read past end of memory source");
    }
    const auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    return Ok(Bytes(begin, begin + static_cast<std::ptrdiff_t>(length)));
}

// ════════════════════════════════════════════════════════
// ChunkSource
// ════════════════════════════════════════════════════════

Result<ChunkSource> ChunkSource::create(std::shared_ptr<const ByteSource> bytes, std::uint64_t chunk_size) {
    if (!bytes) {
        return Fail<ChunkSource>(ErrorCode::InvalidState, "Chunk source needs a byte source");
    }
    if (chunk_size == 0) {
        return Fail<ChunkSource>(ErrorCode::InvalidState, "Chunk size must be positive");
    }
    const auto count = (bytes->size() + chunk_size - 1) / chunk_size;
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        return Fail<ChunkSource>(ErrorCode::InvalidState, "Too many chunks for chunk size "
                                 + std::to_string(chunk_size));
    }
    return Ok(ChunkSource(std::move(bytes), chunk_size));
}

ChunkSource::ChunkSource(std::shared_ptr<const ByteSource> bytes, std::uint64_t chunk_size)
    : bytes_(std::move(bytes)),
      chunk_size_(chunk_size),
      total_size_(bytes_->size()),
      chunk_count_(chunk_count_for(total_size_, chunk_size)) {}

Result<ChunkRange> ChunkSource::range(ChunkIndex index) const {
    if (index >= chunk_count_) {
        return Fail<ChunkRange>(ErrorCode::InvalidState, "Chunk index " + std::to_string(index)
                                + " outside [0, " + std::to_string(chunk_count_) + ")");
    }
    const std::uint64_t offset = static_cast<std::uint64_t>(index) * chunk_size_;
    const std::uint64_t length = std::min(chunk_size_, total_size_ - offset);
    return Ok(ChunkRange{index, ByteRange{offset, length}});
}

Result<std::vector<std::uint8_t>> ChunkSource::read(ChunkIndex index) const {
    auto chunk = range(index);
    if (chunk.is_error()) {
        return Err<std::vector<std::uint8_t>>(chunk.error());
    }
    return read(chunk.value());
}

Result<std::vector<std::uint8_t>> ChunkSource::read(const ChunkRange& chunk) const {
    return bytes_->read(chunk.bytes.offset, chunk.bytes.length);
}

std::optional<ChunkRange> ChunkSource::Cursor::next() {
    if (position_ >= source_->chunk_count()) {
        return std::nullopt;
    }
    auto chunk = source_->range(position_);
    ++position_;
    return chunk.value();
}

} // namespace chunkup::upload
