#include "error.hpp"
#include <fmt/core.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace rcopy::infra {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::InvalidConfig:      return "invalid configuration";
        case ErrorCode::ResumeState:        return "resume state error";
        case ErrorCode::FileNotFound:       return "file not found";
        case ErrorCode::PermissionDenied:   return "permission denied";
        case ErrorCode::DiskFull:           return "disk full";
        case ErrorCode::IoError:            return "I/O error";
        case ErrorCode::InvariantViolation: return "invariant violation";
        case ErrorCode::Interrupted:        return "interrupted";
        case ErrorCode::Unknown:            break;
    }
    return "unknown error";
}

bool Error::is_operator_error() const {
    switch (code) {
        case ErrorCode::InvalidConfig:
        case ErrorCode::ResumeState:
        case ErrorCode::FileNotFound:
        case ErrorCode::PermissionDenied:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    // Отмена пользователем считается штатным завершением
    if (is_cancellation()) return EXIT_SUCCESS;
    return EXIT_FAILURE;
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

Error make_io_error(std::string_view operation, const std::filesystem::path& path,
                    int err, const std::source_location& loc) {
    ErrorCode code = ErrorCode::IoError;
    switch (err) {
        case ENOENT: code = ErrorCode::FileNotFound; break;
        case EACCES:
        case EPERM:  code = ErrorCode::PermissionDenied; break;
        case ENOSPC: code = ErrorCode::DiskFull; break;
        default: break;
    }
    return Error{code,
                 fmt::format("{} failed for {}: {}", operation, path.string(), std::strerror(err)),
                 loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_cancellation() ? spdlog::level::warn : spdlog::level::err;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace rcopy::infra
