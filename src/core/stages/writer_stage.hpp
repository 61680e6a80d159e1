#pragma once

#include <cstdint>
#include <functional>
#include <stop_token>
#include "adapters/fs.hpp"
#include "core/copy_job.hpp"
#include "core/chunk_source/chunk_source.hpp"
#include "extensions/checkpoint.hpp"
#include "infra/bounded_queue/bounded_queue.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace rcopy::core {

// (index, committed offset), called after the checkpoint for that chunk is durable
using CommitObserver = std::function<void(ChunkIndex, std::uint64_t)>;

/// Writes chunks to the destination in index order and advances the checkpoint.
///
/// For every chunk: write, fsync the destination, persist the new offset, then
/// report progress. The checkpoint therefore never covers bytes that are not
/// on disk yet.
class WriterStage {
public:
    WriterStage(adapters::fs::File& destination,
                extensions::CheckpointStore& checkpoint,
                ChunkIndexSource geometry,
                infra::ProgressMonitor& monitor,
                CommitObserver observer = {});

    /// Returns the committed offset after this chunk.
    [[nodiscard]] auto write_chunk(const ChunkPayload& payload) -> infra::Result<std::uint64_t>;

    /// Consumes payloads until `input` is closed and drained or `st` is triggered.
    [[nodiscard]] auto run(infra::BoundedQueue<ChunkPayload>& input,
                           std::stop_token st) -> infra::VoidResult;

    [[nodiscard]] auto committed() const -> std::uint64_t { return committed_; }
    [[nodiscard]] auto chunks_written() const -> std::uint64_t { return next_index_; }

private:
    adapters::fs::File& destination_;
    extensions::CheckpointStore& checkpoint_;
    const ChunkIndexSource geometry_;
    infra::ProgressMonitor& monitor_;
    CommitObserver observer_;

    std::uint64_t committed_;
    ChunkIndex next_index_ = 0;
};

} // namespace rcopy::core
