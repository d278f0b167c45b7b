#include "fs.hpp"
#include <cerrno>
#include <cstring>
#include <utility>
#include <fmt/core.h>

#include <fcntl.h>
#include <unistd.h>

namespace progcp::adapters::fs {

namespace {

auto errno_to_code(int err, infra::ErrorCode fallback) -> infra::ErrorCode {
    switch (err) {
        case ENOENT:  return infra::ErrorCode::FileNotFound;
        case EACCES:
        case EPERM:   return infra::ErrorCode::PermissionDenied;
        case ENOTDIR:
        case EISDIR:
        case ENAMETOOLONG: return infra::ErrorCode::InvalidPath;
        default:      return fallback;
    }
}

} // namespace

FileDescriptor::~FileDescriptor() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

auto FileDescriptor::close() -> infra::VoidResult {
    if (fd_ < 0) return {};
    const int fd = std::exchange(fd_, -1);
    if (::close(fd) == -1 && errno != EINTR) {
        return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
            fmt::format("close failed: {}", std::strerror(errno))));
    }
    return {};
}

auto open_source(const std::filesystem::path& path) -> infra::Result<FileDescriptor> {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        const int err = errno;
        return std::unexpected(infra::make_error(errno_to_code(err, infra::ErrorCode::ReadFailed),
            fmt::format("Cannot open {}: {}", path.string(), std::strerror(err))));
    }
    return FileDescriptor{fd};
}

auto open_destination(const std::filesystem::path& path) -> infra::Result<FileDescriptor> {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd == -1) {
        const int err = errno;
        return std::unexpected(infra::make_error(errno_to_code(err, infra::ErrorCode::WriteFailed),
            fmt::format("Cannot create {}: {}", path.string(), std::strerror(err))));
    }
    return FileDescriptor{fd};
}

auto read_chunk(const FileDescriptor& fd, std::span<char> buffer) -> infra::Result<ReadChunk> {
    const auto n = ::read(fd.get(), buffer.data(), buffer.size());
    if (n == -1) {
        if (errno == EINTR) {
            return ReadChunk{.bytes = 0, .interrupted = true};
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::ReadFailed,
            fmt::format("read failed: {}", std::strerror(errno))));
    }
    return ReadChunk{.bytes = static_cast<std::size_t>(n)};
}

auto write_all(const FileDescriptor& fd, std::span<const char> data) -> infra::VoidResult {
    return write_all(fd.get(), data);
}

auto write_all(int fd, std::span<const char> data) -> infra::VoidResult {
    while (!data.empty()) {
        const auto n = ::write(fd, data.data(), data.size());
        if (n == -1) {
            if (errno == EINTR) continue;
            const char* reason = errno == ENOSPC ? "disk full" : std::strerror(errno);
            return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
                fmt::format("write failed: {}", reason)));
        }
        data = data.subspan(static_cast<std::size_t>(n));
    }
    return {};
}

auto probe_size(const std::filesystem::path& path) -> std::optional<std::uint64_t> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return std::nullopt;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
}

} // namespace progcp::adapters::fs
