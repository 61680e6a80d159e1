#pragma once

#include <stop_token>
#include "adapters/fs.hpp"
#include "core/copy_job.hpp"
#include "core/chunk_source/chunk_source.hpp"
#include "infra/bounded_queue/bounded_queue.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace rcopy::core {

/// Reads chunks from the source in index order. The source read cursor belongs
/// to this stage alone.
class ReaderStage {
public:
    ReaderStage(adapters::fs::File& source,
                ChunkIndexSource geometry,
                infra::ProgressMonitor& monitor);

    /// Reads chunk `index`. The cursor must already sit at chunk_begin(index);
    /// the payload is shorter than chunk_size only at end of file.
    [[nodiscard]] auto read_chunk(ChunkIndex index) -> infra::Result<ChunkPayload>;

    /// Pops indices until `input` is closed and drained or `st` is triggered.
    /// `output` is closed on every exit path.
    [[nodiscard]] auto run(infra::BoundedQueue<ChunkIndex>& input,
                           infra::BoundedQueue<ChunkPayload>& output,
                           std::stop_token st) -> infra::VoidResult;

    [[nodiscard]] auto chunks_read() const -> std::uint64_t { return chunks_read_; }

private:
    [[nodiscard]] auto pump_(infra::BoundedQueue<ChunkIndex>& input,
                             infra::BoundedQueue<ChunkPayload>& output,
                             std::stop_token st) -> infra::VoidResult;

    adapters::fs::File& source_;
    const ChunkIndexSource geometry_;
    infra::ProgressMonitor& monitor_;
    std::uint64_t chunks_read_ = 0;
};

} // namespace rcopy::core
