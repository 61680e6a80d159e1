// checkpoint.cpp
#include "checkpoint.hpp"
#include <charconv>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace rcopy::extensions {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\v\f";

} // namespace

auto parse_offset(std::string_view text) -> infra::Result<std::uint64_t>
{
    auto line = text.substr(0, text.find('\n'));

    auto first = line.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ResumeState,
                             "Unrecognizable content in offset file"));
    }
    auto last = line.find_last_not_of(kWhitespace);
    line = line.substr(first, last - first + 1);

    if (line.front() == '+') {
        line.remove_prefix(1);
    }

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), value);
    if (ec != std::errc{} || ptr != line.data() + line.size() || line.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ResumeState,
                             fmt::format("Unrecognizable content in offset file: '{}'", line)));
    }
    return value;
}

CheckpointStore::CheckpointStore(std::filesystem::path path)
    : path_(std::move(path)) {}

auto CheckpointStore::load() -> infra::Result<std::uint64_t>
{
    auto existing = adapters::fs::File::open(path_, adapters::fs::File::Mode::ReadWrite);
    if (existing) {
        file_ = std::move(*existing);

        auto text = file_.read_all_text();
        if (!text) {
            return std::unexpected(std::move(text.error()));
        }
        auto offset = parse_offset(*text);
        if (!offset) {
            return std::unexpected(infra::make_error(offset.error().code,
                                 fmt::format("{} ({})", offset.error().message, path_.string())));
        }

        last_ = *offset;
        spdlog::debug("Loaded checkpoint {} = {}", path_.string(), *offset);
        return *offset;
    }

    if (existing.error().code != infra::ErrorCode::FileNotFound) {
        return std::unexpected(std::move(existing.error()));
    }

    auto fresh = adapters::fs::File::open(path_, adapters::fs::File::Mode::CreateNew);
    if (!fresh) {
        return std::unexpected(std::move(fresh.error()));
    }
    file_ = std::move(*fresh);
    created_ = true;

    if (auto res = persist(0); !res) {
        return std::unexpected(std::move(res.error()));
    }
    spdlog::debug("Created checkpoint {}", path_.string());
    return 0;
}

auto CheckpointStore::persist(std::uint64_t offset) -> infra::VoidResult
{
    if (!file_.is_open()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvariantViolation,
                             "Checkpoint persisted before it was loaded"));
    }
    if (last_ && offset < *last_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvariantViolation,
                             fmt::format("Checkpoint would move backwards: {} -> {}", *last_, offset)));
    }

    if (auto res = file_.rewrite_text(fmt::format("{}", offset)); !res) {
        return res;
    }
    if (auto res = file_.sync(); !res) {
        return res;
    }

    last_ = offset;
    return {};
}

auto CheckpointStore::close() -> infra::VoidResult
{
    return file_.close();
}

} // namespace rcopy::extensions
