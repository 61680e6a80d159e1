#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace rcopy::core {

inline constexpr std::size_t kMinChunkSize = 1024;
inline constexpr std::size_t kMaxChunkSize = std::size_t{1} << 30;   // 1 GiB, один буфер на чанк
inline constexpr std::size_t kDefaultChunkSize = 10 * 1024 * 1024; // 10 MiB
inline constexpr std::size_t kDefaultMaxChunksBuffer = 10;

using ChunkIndex = std::uint64_t;

struct CopyJob {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::filesystem::path checkpoint;           // по умолчанию <destination>.offset
    std::size_t chunk_size = kDefaultChunkSize;
    std::size_t max_chunks_buffer = kDefaultMaxChunksBuffer;

    [[nodiscard]] auto validate() const -> infra::VoidResult;
};

/// Checkpoint path used when none is given: "<destination>.offset".
[[nodiscard]] auto default_checkpoint_path(const std::filesystem::path& destination)
    -> std::filesystem::path;

struct ChunkPayload {
    ChunkIndex index = 0;
    std::vector<std::byte> bytes;
};

} // namespace rcopy::core
