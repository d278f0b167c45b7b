#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace progcp::infra {

namespace {

// sysexits.h: EX_SOFTWARE
constexpr int kInternalErrorExitCode = 70;

} // namespace

bool Error::is_internal() const {
    return code == ErrorCode::NoMoreFiles || code == ErrorCode::NoActiveFile;
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::PermissionDenied:
        case ErrorCode::InvalidPath:
        case ErrorCode::ConfigInvalid:
        case ErrorCode::NoMoreFiles:
        case ErrorCode::NoActiveFile:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    if (is_internal()) return kInternalErrorExitCode;
    if (code == ErrorCode::Interrupted) return 130; // SIGINT
    return EXIT_FAILURE;
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

Error log_and_return(Error&& err) {
    auto level = spdlog::level::warn;
    if (err.is_internal()) {
        level = spdlog::level::critical;
    } else if (err.is_fatal()) {
        level = spdlog::level::err;
    }
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FileNotFound:     return "FileNotFound";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::InvalidPath:      return "InvalidPath";
        case ErrorCode::ReadFailed:       return "ReadFailed";
        case ErrorCode::WriteFailed:      return "WriteFailed";
        case ErrorCode::ConfigInvalid:    return "ConfigInvalid";
        case ErrorCode::Interrupted:      return "Interrupted";
        case ErrorCode::NoMoreFiles:      return "NoMoreFiles";
        case ErrorCode::NoActiveFile:     return "NoActiveFile";
        case ErrorCode::Unknown:          return "Unknown";
    }
    return "Unknown";
}

} // namespace progcp::infra
