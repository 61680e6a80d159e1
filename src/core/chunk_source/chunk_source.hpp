#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include "core/copy_job.hpp"
#include "infra/error_handler/error.hpp"

namespace rcopy::core {

/// Sequential chunk indices for the bytes between the resume offset and the end
/// of the source. Index 0 starts at the resume offset, not at byte 0.
class ChunkIndexSource {
public:
    /// Fails with ResumeState when offset > file_size. When offset == file_size
    /// the source is empty and is_complete() is true.
    [[nodiscard]] static auto plan(std::uint64_t file_size,
                                   std::uint64_t offset,
                                   std::size_t chunk_size)
        -> infra::Result<ChunkIndexSource>;

    [[nodiscard]] auto next() -> std::optional<ChunkIndex>;

    [[nodiscard]] auto is_complete() const -> bool { return chunks_left_ == 0; }
    [[nodiscard]] auto chunks_left() const -> std::uint64_t { return chunks_left_; }
    [[nodiscard]] auto offset() const -> std::uint64_t { return offset_; }
    [[nodiscard]] auto file_size() const -> std::uint64_t { return file_size_; }
    [[nodiscard]] auto chunk_size() const -> std::size_t { return chunk_size_; }

    // Позиция в файле, с которой начинается чанк index
    [[nodiscard]] auto chunk_begin(ChunkIndex index) const -> std::uint64_t {
        return offset_ + index * static_cast<std::uint64_t>(chunk_size_);
    }

private:
    ChunkIndexSource(std::uint64_t file_size, std::uint64_t offset,
                     std::size_t chunk_size, std::uint64_t chunks_left)
        : file_size_(file_size), offset_(offset)
        , chunk_size_(chunk_size), chunks_left_(chunks_left) {}

    std::uint64_t file_size_;
    std::uint64_t offset_;
    std::size_t chunk_size_;
    std::uint64_t chunks_left_;
    ChunkIndex next_ = 0;
};

} // namespace rcopy::core
