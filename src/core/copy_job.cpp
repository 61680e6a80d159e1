#include "copy_job.hpp"
#include <fmt/core.h>

namespace rcopy::core {

auto CopyJob::validate() const -> infra::VoidResult {
    if (chunk_size < kMinChunkSize) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidConfig,
                             fmt::format("The chunk size should be at least {} bytes (got {})",
                                         kMinChunkSize, chunk_size)));
    }
    if (chunk_size > kMaxChunkSize) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidConfig,
                             fmt::format("The chunk size should be at most {} bytes (got {})",
                                         kMaxChunkSize, chunk_size)));
    }
    if (max_chunks_buffer == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidConfig,
                             "The chunk buffer should hold at least one chunk"));
    }
    if (source.empty() || destination.empty() || checkpoint.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidConfig,
                             "Source, destination and checkpoint paths are required"));
    }
    return {};
}

auto default_checkpoint_path(const std::filesystem::path& destination) -> std::filesystem::path {
    auto path = destination;
    path += ".offset";
    return path;
}

} // namespace rcopy::core
