#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkup::upload {

/**
 * @brief Random-access byte provider behind a ChunkSource
 *
 * Implementations must be safe for concurrent read() calls from several
 * workers. The caller guarantees the content does not change while a
 * session uses it.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    [[nodiscard]] virtual std::uint64_t size() const = 0;

    virtual Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::uint64_t length) const = 0;
};

/// Reads a local file, opening a fresh stream per call
class FileByteSource : public ByteSource {
public:
    static Result<std::shared_ptr<FileByteSource>> open(const std::filesystem::path& path);

    FileByteSource(std::filesystem::path path, std::uint64_t size);

    [[nodiscard]] std::uint64_t size() const override { return size_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::uint64_t length) const override;

private:
    std::filesystem::path path_;
    std::uint64_t size_;
};

class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    [[nodiscard]] std::uint64_t size() const override { return data_.size(); }

    Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::uint64_t length) const override;

private:
    std::vector<std::uint8_t> data_;
};

/**
 * @brief Splits a ByteSource into fixed-size, gap-free chunk ranges
 *
 * Chunk i covers [i * chunk_size, min((i + 1) * chunk_size, total_size)).
 * Only the last chunk may be shorter than chunk_size.
 */
class ChunkSource {
public:
    /// Lazy, restartable walk over every chunk in index order
    class Cursor {
    public:
        explicit Cursor(const ChunkSource& source) : source_(&source) {}

        std::optional<ChunkRange> next();
        void reset() noexcept { position_ = 0; }

    private:
        const ChunkSource* source_;
        ChunkIndex position_ = 0;
    };

    static Result<ChunkSource> create(std::shared_ptr<const ByteSource> bytes, std::uint64_t chunk_size);

    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint64_t total_size() const noexcept { return total_size_; }
    [[nodiscard]] std::uint32_t chunk_count() const noexcept { return chunk_count_; }

    Result<ChunkRange> range(ChunkIndex index) const;
    Result<std::vector<std::uint8_t>> read(ChunkIndex index) const;
    Result<std::vector<std::uint8_t>> read(const ChunkRange& range) const;

    [[nodiscard]] Cursor cursor() const { return Cursor(*this); }

private:
    ChunkSource(std::shared_ptr<const ByteSource> bytes, std::uint64_t chunk_size);

    std::shared_ptr<const ByteSource> bytes_;
    std::uint64_t chunk_size_;
    std::uint64_t total_size_;
    std::uint32_t chunk_count_;
};

} // namespace chunkup::upload
