#pragma once

#include <filesystem>
#include <expected>
#include <stop_token>
#include <string_view>
#include "adapters/fs.hpp"
#include "core/copy_job.hpp"
#include "core/stages/writer_stage.hpp"
#include "extensions/checkpoint.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace rcopy::core {

enum class CopyOutcome {
    AlreadyComplete,   // checkpoint уже равен размеру файла, потоки не открывались
    Completed
};

[[nodiscard]] auto to_string(CopyOutcome outcome) -> std::string_view;

/// Resumable single-file copy.
///
/// start() loads (or creates) the checkpoint, then streams the remaining bytes
/// through a reader thread and a writer thread connected by bounded queues.
/// Cancellation through the stop token is reported as ErrorCode::Interrupted,
/// with the checkpoint left at the end of the last committed chunk.
class Copier {
public:
    /// Fails with InvalidConfig before touching any file.
    [[nodiscard]] static auto create(CopyJob job, infra::ProgressMonitor& monitor)
        -> infra::Result<Copier>;

    [[nodiscard]] auto start(std::stop_token cancel = {}) -> infra::Result<CopyOutcome>;

    // Для тестов и внешнего наблюдения за прогрессом
    void set_commit_observer(CommitObserver observer) { observer_ = std::move(observer); }

    [[nodiscard]] auto job() const -> const CopyJob& { return job_; }

private:
    Copier(CopyJob job, infra::ProgressMonitor& monitor);

    [[nodiscard]] auto stream_(extensions::CheckpointStore& checkpoint,
                               const ChunkIndexSource& plan,
                               std::stop_token cancel) -> infra::Result<CopyOutcome>;

    [[nodiscard]] auto run_pipeline_(adapters::fs::File& source,
                                     adapters::fs::File& destination,
                                     extensions::CheckpointStore& checkpoint,
                                     ChunkIndexSource plan,
                                     std::stop_token cancel) -> infra::Result<CopyOutcome>;

    [[nodiscard]] auto finish_complete_(extensions::CheckpointStore& checkpoint)
        -> infra::Result<CopyOutcome>;

    CopyJob job_;
    infra::ProgressMonitor& monitor_;
    CommitObserver observer_;
};

} // namespace rcopy::core
