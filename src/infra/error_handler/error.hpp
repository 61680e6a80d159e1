#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace rcopy::infra {

enum class ErrorCode {
    // Ошибки оператора (неверные аргументы, испорченный checkpoint)
    InvalidConfig,
    ResumeState,
    FileNotFound,
    PermissionDenied,

    // Ввод-вывод
    DiskFull,
    IoError,

    // Внутренние
    InvariantViolation,

    // Не ошибка: пользователь отменил копирование
    Interrupted,

    Unknown,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    // Misconfiguration the operator can fix, as opposed to an unexpected failure.
    [[nodiscard]] auto is_operator_error() const -> bool;
    [[nodiscard]] auto is_cancellation() const -> bool { return code == ErrorCode::Interrupted; }
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

/// Builds an I/O error from an errno value: ENOENT, EACCES/EPERM and ENOSPC get
/// their own codes, everything else is IoError. The message names the operation
/// and the path.
[[nodiscard]] auto make_io_error(
    std::string_view operation,
    const std::filesystem::path& path,
    int err,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace rcopy::infra
