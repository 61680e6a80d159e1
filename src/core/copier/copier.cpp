#include "copier.hpp"
#include <optional>
#include <stop_token>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "core/chunk_source/chunk_source.hpp"
#include "core/stages/reader_stage.hpp"
#include "core/stages/writer_stage.hpp"
#include "infra/bounded_queue/bounded_queue.hpp"
#include "infra/stage_worker/stage_worker.hpp"

namespace rcopy::core {

namespace {

// Закрывает все дескрипторы на любом пути выхода. Ошибка закрытия заменяет
// результат только если он был успешным, иначе просто логируется.
template<typename T, typename... Handles>
auto release_all(infra::Result<T> result, Handles&... handles) -> infra::Result<T> {
    ([&] {
        auto closed = handles.close();
        if (closed) return;
        if (result) {
            result = std::unexpected(std::move(closed.error()));
        } else {
            spdlog::warn("Failed to release {}: {}", handles.path().string(), closed.error().message);
        }
    }(), ...);
    return result;
}

} // namespace

auto to_string(CopyOutcome outcome) -> std::string_view {
    switch (outcome) {
        case CopyOutcome::AlreadyComplete: return "already complete";
        case CopyOutcome::Completed:       return "completed";
    }
    return "unknown";
}

Copier::Copier(CopyJob job, infra::ProgressMonitor& monitor)
    : job_(std::move(job)), monitor_(monitor) {}

auto Copier::create(CopyJob job, infra::ProgressMonitor& monitor) -> infra::Result<Copier>
{
    if (auto valid = job.validate(); !valid) {
        return std::unexpected(std::move(valid.error()));
    }
    return Copier{std::move(job), monitor};
}

auto Copier::start(std::stop_token cancel) -> infra::Result<CopyOutcome>
{
    using Outcome = infra::Result<CopyOutcome>;

    auto size = adapters::fs::file_size(job_.source);
    if (!size) {
        return std::unexpected(std::move(size.error()));
    }

    extensions::CheckpointStore checkpoint{job_.checkpoint};
    auto offset = checkpoint.load();
    if (!offset) {
        return release_all(Outcome{std::unexpected(std::move(offset.error()))}, checkpoint);
    }

    auto plan = ChunkIndexSource::plan(*size, *offset, job_.chunk_size);
    if (!plan) {
        return release_all(Outcome{std::unexpected(std::move(plan.error()))}, checkpoint);
    }

    monitor_.set_total(*size, *offset);

    if (plan->is_complete()) {
        return release_all(finish_complete_(checkpoint), checkpoint);
    }

    if (*offset > 0) {
        spdlog::info("Resuming from offset {} of {} ({} chunks left)",
                     *offset, *size, plan->chunks_left());
    } else {
        spdlog::info("Copying {} bytes in {} chunks of {} bytes",
                     *size, plan->chunks_left(), job_.chunk_size);
    }

    return release_all(stream_(checkpoint, *plan, cancel), checkpoint);
}

auto Copier::finish_complete_(extensions::CheckpointStore& checkpoint)
    -> infra::Result<CopyOutcome>
{
    if (!checkpoint.created()) {
        spdlog::info("Nothing to copy: checkpoint {} already covers the whole file",
                     checkpoint.path().string());
        return CopyOutcome::AlreadyComplete;
    }

    // Пустой источник и новый checkpoint. Единственный случай, когда при полном
    // плане открывается поток: без него после копирования не было бы файла,
    // побайтно равного источнику.
    auto destination = adapters::fs::File::open(job_.destination, adapters::fs::File::Mode::Write);
    if (!destination) {
        return std::unexpected(std::move(destination.error()));
    }
    return release_all(infra::Result<CopyOutcome>{CopyOutcome::Completed}, *destination);
}

auto Copier::stream_(extensions::CheckpointStore& checkpoint,
                     const ChunkIndexSource& plan,
                     std::stop_token cancel) -> infra::Result<CopyOutcome>
{
    using Outcome = infra::Result<CopyOutcome>;

    auto source = adapters::fs::File::open(job_.source, adapters::fs::File::Mode::Read);
    if (!source) {
        return std::unexpected(std::move(source.error()));
    }

    auto destination = adapters::fs::File::open(job_.destination, adapters::fs::File::Mode::Write);
    if (!destination) {
        return release_all(Outcome{std::unexpected(std::move(destination.error()))}, *source);
    }

    if (auto res = source->seek(plan.offset()); !res) {
        return release_all(Outcome{std::unexpected(std::move(res.error()))}, *source, *destination);
    }
    if (auto res = destination->seek(plan.offset()); !res) {
        return release_all(Outcome{std::unexpected(std::move(res.error()))}, *source, *destination);
    }

    return release_all(run_pipeline_(*source, *destination, checkpoint, plan, cancel),
                       *source, *destination);
}

auto Copier::run_pipeline_(adapters::fs::File& source,
                           adapters::fs::File& destination,
                           extensions::CheckpointStore& checkpoint,
                           ChunkIndexSource plan,
                           std::stop_token cancel) -> infra::Result<CopyOutcome>
{
    // Внешняя отмена и ошибка любой стадии останавливают весь конвейер
    std::stop_source pipeline_stop;
    std::stop_callback forward_cancel(cancel, [&pipeline_stop] { pipeline_stop.request_stop(); });
    const auto token = pipeline_stop.get_token();

    infra::BoundedQueue<ChunkIndex> indices{job_.max_chunks_buffer};
    infra::BoundedQueue<ChunkPayload> chunks{job_.max_chunks_buffer};

    ReaderStage reader{source, plan, monitor_};
    WriterStage writer{destination, checkpoint, plan, monitor_, observer_};

    std::optional<infra::Error> failure;
    {
        // Если что-то бросит до wait(), ~StageWorker остановит конвейер перед join
        infra::StageWorker reader_worker{"reader", pipeline_stop,
            [&] { return reader.run(indices, chunks, token); }};
        infra::StageWorker writer_worker{"writer", pipeline_stop,
            [&] { return writer.run(chunks, token); }};

        while (auto index = plan.next()) {
            if (!indices.push(*index, token)) {
                break;
            }
        }
        indices.close();

        // Writer первым: его ошибка относится к уже записанным данным
        for (auto* worker : {&writer_worker, &reader_worker}) {
            auto result = worker->wait();
            if (!result && !failure) {
                failure = std::move(result.error());
            }
        }
    }

    if (failure) {
        return std::unexpected(std::move(*failure));
    }

    const auto committed = writer.committed();
    if (committed == plan.file_size()) {
        spdlog::info("Copied {} bytes in {} chunks",
                     committed - plan.offset(), writer.chunks_written());
        return CopyOutcome::Completed;
    }

    if (cancel.stop_requested()) {
        spdlog::warn("Copy cancelled; checkpoint at {} of {} bytes", committed, plan.file_size());
        return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                             fmt::format("Copy cancelled after {} of {} bytes", committed, plan.file_size())));
    }

    return std::unexpected(infra::make_error(infra::ErrorCode::InvariantViolation,
                         fmt::format("Copy stopped at offset {} but the source has {} bytes; "
                                     "was it modified during the copy?",
                                     committed, plan.file_size())));
}

} // namespace rcopy::core
