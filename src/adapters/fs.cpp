#include "fs.hpp"

#include <cerrno>
#include <utility>
#include <fmt/core.h>

#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace rcopy::adapters::fs {

auto file_size(const std::filesystem::path& path) -> infra::Result<std::uint64_t> {
    struct stat sb;
    if (::stat(path.c_str(), &sb) == -1) {
        return std::unexpected(infra::make_io_error("stat", path, errno));
    }
    if (!S_ISREG(sb.st_mode)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidConfig,
                             fmt::format("Not a regular file: {}", path.string())));
    }
    return static_cast<std::uint64_t>(sb.st_size);
}

File::~File() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

File::File(File&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , path_(std::move(other.path_))
{}

File& File::operator=(File&& other) noexcept {
    if (this != &other) {
        if (fd_ != -1) {
            ::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

auto File::open(const std::filesystem::path& path, Mode mode) -> infra::Result<File> {
    int flags = O_CLOEXEC;
    switch (mode) {
        case Mode::Read:      flags |= O_RDONLY; break;
        case Mode::Write:     flags |= O_WRONLY | O_CREAT; break;
        case Mode::ReadWrite: flags |= O_RDWR; break;
        case Mode::CreateNew: flags |= O_RDWR | O_CREAT | O_EXCL; break;
    }

    int fd = ::open(path.c_str(), flags, 0644);
    if (fd == -1) {
        return std::unexpected(infra::make_io_error("open", path, errno));
    }
    return File{fd, path};
}

auto File::position() const -> infra::Result<std::uint64_t> {
    off_t pos = ::lseek(fd_, 0, SEEK_CUR);
    if (pos == -1) {
        return std::unexpected(infra::make_io_error("lseek", path_, errno));
    }
    return static_cast<std::uint64_t>(pos);
}

auto File::seek(std::uint64_t offset) -> infra::VoidResult {
    if (::lseek(fd_, static_cast<off_t>(offset), SEEK_SET) == -1) {
        return std::unexpected(infra::make_io_error("lseek", path_, errno));
    }
    return {};
}

auto File::read_full(std::span<std::byte> buffer) -> infra::Result<std::size_t> {
    std::size_t total = 0;
    while (total < buffer.size()) {
        ssize_t n = ::read(fd_, buffer.data() + total, buffer.size() - total);
        if (n == -1) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_io_error("read", path_, errno));
        }
        if (n == 0) {
            break; // EOF
        }
        total += static_cast<std::size_t>(n);
    }
    return total;
}

auto File::write_all(std::span<const std::byte> data) -> infra::VoidResult {
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n == -1) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_io_error("write", path_, errno));
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

auto File::read_all_text() -> infra::Result<std::string> {
    std::string text;
    char buf[256];
    off_t offset = 0;
    for (;;) {
        ssize_t n = ::pread(fd_, buf, sizeof(buf), offset);
        if (n == -1) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_io_error("read", path_, errno));
        }
        if (n == 0) break;
        text.append(buf, static_cast<std::size_t>(n));
        offset += n;
    }
    return text;
}

auto File::rewrite_text(std::string_view text) -> infra::VoidResult {
    if (::ftruncate(fd_, 0) == -1) {
        return std::unexpected(infra::make_io_error("ftruncate", path_, errno));
    }

    std::size_t written = 0;
    while (written < text.size()) {
        ssize_t n = ::pwrite(fd_, text.data() + written, text.size() - written,
                             static_cast<off_t>(written));
        if (n == -1) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_io_error("write", path_, errno));
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

auto File::sync() -> infra::VoidResult {
    if (::fsync(fd_) == -1) {
        return std::unexpected(infra::make_io_error("fsync", path_, errno));
    }
    return {};
}

auto File::close() -> infra::VoidResult {
    if (fd_ == -1) {
        return {};
    }
    int fd = std::exchange(fd_, -1);
    if (::close(fd) == -1) {
        return std::unexpected(infra::make_io_error("close", path_, errno));
    }
    return {};
}

} // namespace rcopy::adapters::fs
