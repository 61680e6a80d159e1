#pragma once

#include <filesystem>
#include <expected>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace rcopy::adapters::fs {

[[nodiscard]] auto file_size(const std::filesystem::path& path)
    -> infra::Result<std::uint64_t>;

/// Owning wrapper around a POSIX file descriptor.
/// close() is meant to be called explicitly so that its failure can be reported;
/// the destructor only closes what was left open.
class File {
public:
    enum class Mode {
        Read,         // O_RDONLY
        Write,        // O_WRONLY | O_CREAT, никогда не обрезается
        ReadWrite,    // O_RDWR
        CreateNew     // O_RDWR | O_CREAT | O_EXCL
    };

    File() = default;
    ~File();

    File(const File&) = delete;
    File& operator=(const File&) = delete;
    File(File&& other) noexcept;
    File& operator=(File&& other) noexcept;

    [[nodiscard]] static auto open(const std::filesystem::path& path, Mode mode)
        -> infra::Result<File>;

    [[nodiscard]] auto is_open() const -> bool { return fd_ != -1; }
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    [[nodiscard]] auto position() const -> infra::Result<std::uint64_t>;
    [[nodiscard]] auto seek(std::uint64_t offset) -> infra::VoidResult;

    // Читает до buffer.size() байт, повторяя частичные чтения; меньше только на EOF.
    [[nodiscard]] auto read_full(std::span<std::byte> buffer) -> infra::Result<std::size_t>;
    [[nodiscard]] auto write_all(std::span<const std::byte> data) -> infra::VoidResult;

    // Checkpoint helpers: whole-file read and truncate-then-rewrite at offset 0.
    [[nodiscard]] auto read_all_text() -> infra::Result<std::string>;
    [[nodiscard]] auto rewrite_text(std::string_view text) -> infra::VoidResult;

    [[nodiscard]] auto sync() -> infra::VoidResult;
    [[nodiscard]] auto close() -> infra::VoidResult;

private:
    File(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}

    int fd_ = -1;
    std::filesystem::path path_;
};

} // namespace rcopy::adapters::fs
