// checkpoint.hpp
#pragma once

#include <filesystem>
#include <optional>
#include <cstdint>
#include <string_view>
#include "adapters/fs.hpp"
#include "infra/error_handler/error.hpp"

namespace rcopy::extensions {

/// Parses checkpoint text: the first line, surrounding whitespace ignored.
/// Anything that is not a non-negative base-10 integer is a ResumeState error.
[[nodiscard]] auto parse_offset(std::string_view text) -> infra::Result<std::uint64_t>;

/// Committed-byte offset kept as decimal text in a side file.
///
/// The file is truncated and rewritten on every persist, which is not atomic:
/// a crash between ftruncate and write leaves it empty and the next load fails.
class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path path);

    CheckpointStore(const CheckpointStore&) = delete;
    CheckpointStore& operator=(const CheckpointStore&) = delete;
    CheckpointStore(CheckpointStore&&) = default;
    CheckpointStore& operator=(CheckpointStore&&) = default;

    // Создаёт файл с "0", если его нет; иначе читает и разбирает содержимое.
    [[nodiscard]] auto load() -> infra::Result<std::uint64_t>;

    // ftruncate + write + fsync. Offset must not go backwards.
    [[nodiscard]] auto persist(std::uint64_t offset) -> infra::VoidResult;

    [[nodiscard]] auto close() -> infra::VoidResult;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto created() const -> bool { return created_; }
    [[nodiscard]] auto last_persisted() const -> std::optional<std::uint64_t> { return last_; }

private:
    std::filesystem::path path_;
    adapters::fs::File file_;
    std::optional<std::uint64_t> last_;
    bool created_ = false;
};

} // namespace rcopy::extensions
