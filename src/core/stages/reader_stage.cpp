#include "reader_stage.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace rcopy::core {

ReaderStage::ReaderStage(adapters::fs::File& source,
                         ChunkIndexSource geometry,
                         infra::ProgressMonitor& monitor)
    : source_(source), geometry_(geometry), monitor_(monitor) {}

auto ReaderStage::read_chunk(ChunkIndex index) -> infra::Result<ChunkPayload>
{
    const auto expected = geometry_.chunk_begin(index);
    auto position = source_.position();
    if (!position) {
        return std::unexpected(std::move(position.error()));
    }
    if (*position != expected) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvariantViolation,
                             fmt::format("Source position is {} but chunk {} starts at {}",
                                         *position, index, expected)));
    }

    ChunkPayload payload{.index = index, .bytes = std::vector<std::byte>(geometry_.chunk_size())};
    auto read = source_.read_full(payload.bytes);
    if (!read) {
        return std::unexpected(std::move(read.error()));
    }

    // Последний чанк может быть короче
    if (*read < payload.bytes.size()) {
        payload.bytes.resize(*read);
    }

    monitor_.pulse();
    return payload;
}

auto ReaderStage::run(infra::BoundedQueue<ChunkIndex>& input,
                      infra::BoundedQueue<ChunkPayload>& output,
                      std::stop_token st) -> infra::VoidResult
{
    auto result = pump_(input, output, st);
    output.close();
    return result;
}

auto ReaderStage::pump_(infra::BoundedQueue<ChunkIndex>& input,
                        infra::BoundedQueue<ChunkPayload>& output,
                        std::stop_token st) -> infra::VoidResult
{
    while (auto index = input.pop(st)) {
        auto payload = read_chunk(*index);
        if (!payload) {
            return std::unexpected(std::move(payload.error()));
        }

        spdlog::trace("Read chunk {} ({} bytes)", *index, payload->bytes.size());
        ++chunks_read_;

        if (!output.push(std::move(*payload), st)) {
            break; // отмена
        }
    }
    return {};
}

} // namespace rcopy::core
