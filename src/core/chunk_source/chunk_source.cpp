#include "chunk_source.hpp"
#include <fmt/core.h>

namespace rcopy::core {

auto ChunkIndexSource::plan(std::uint64_t file_size,
                            std::uint64_t offset,
                            std::size_t chunk_size)
    -> infra::Result<ChunkIndexSource>
{
    if (chunk_size == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidConfig,
                             "Chunk size must be positive"));
    }
    if (file_size < offset) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ResumeState,
                             fmt::format("The bytes copied in the offset file ({}) are more than "
                                         "the size of the file we are supposed to copy ({})",
                                         offset, file_size)));
    }
    if (file_size == offset) {
        return ChunkIndexSource{file_size, offset, chunk_size, 0};
    }

    const std::uint64_t remaining = file_size - offset;
    const std::uint64_t chunks_left = 1 + (remaining - 1) / chunk_size;
    if (chunks_left < 1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvariantViolation,
                             "There should be at least one chunk left"));
    }
    return ChunkIndexSource{file_size, offset, chunk_size, chunks_left};
}

auto ChunkIndexSource::next() -> std::optional<ChunkIndex>
{
    if (next_ >= chunks_left_) {
        return std::nullopt;
    }
    return next_++;
}

} // namespace rcopy::core
