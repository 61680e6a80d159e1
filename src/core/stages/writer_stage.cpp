#include "writer_stage.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace rcopy::core {

WriterStage::WriterStage(adapters::fs::File& destination,
                         extensions::CheckpointStore& checkpoint,
                         ChunkIndexSource geometry,
                         infra::ProgressMonitor& monitor,
                         CommitObserver observer)
    : destination_(destination)
    , checkpoint_(checkpoint)
    , geometry_(geometry)
    , monitor_(monitor)
    , observer_(std::move(observer))
    , committed_(geometry.offset()) {}

auto WriterStage::write_chunk(const ChunkPayload& payload) -> infra::Result<std::uint64_t>
{
    if (payload.index != next_index_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvariantViolation,
                             fmt::format("Chunk {} arrived while chunk {} was expected",
                                         payload.index, next_index_)));
    }

    const auto begin = geometry_.chunk_begin(payload.index);
    auto position = destination_.position();
    if (!position) {
        return std::unexpected(std::move(position.error()));
    }
    if (*position != begin) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvariantViolation,
                             fmt::format("Destination position is {} but chunk {} starts at {}",
                                         *position, payload.index, begin)));
    }

    if (auto res = destination_.write_all(payload.bytes); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (auto res = destination_.sync(); !res) {
        return std::unexpected(std::move(res.error()));
    }

    // Checkpoint только после того, как данные на диске
    const std::uint64_t committed = begin + payload.bytes.size();
    if (auto res = checkpoint_.persist(committed); !res) {
        return std::unexpected(std::move(res.error()));
    }

    committed_ = committed;
    ++next_index_;
    return committed;
}

auto WriterStage::run(infra::BoundedQueue<ChunkPayload>& input,
                      std::stop_token st) -> infra::VoidResult
{
    while (auto payload = input.pop(st)) {
        auto committed = write_chunk(*payload);
        if (!committed) {
            return std::unexpected(std::move(committed.error()));
        }

        spdlog::debug("Committed chunk {}: offset {}", payload->index, *committed);
        monitor_.update(*committed);
        if (observer_) {
            observer_(payload->index, *committed);
        }
    }
    return {};
}

} // namespace rcopy::core
