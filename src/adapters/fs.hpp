#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include "infra/error_handler/error.hpp"

namespace progcp::adapters::fs {

/// Владеющий POSIX-дескриптор, закрывается в деструкторе.
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor();

    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] auto get() const -> int { return fd_; }
    [[nodiscard]] auto is_open() const -> bool { return fd_ >= 0; }

    // Явное закрытие с проверкой ошибки (close() может сообщить о сбое записи)
    [[nodiscard]] auto close() -> infra::VoidResult;

private:
    int fd_ = -1;
};

struct ReadChunk {
    std::size_t bytes = 0;
    bool interrupted = false;   // EINTR: пришёл сигнал, данных нет
};

[[nodiscard]] auto open_source(const std::filesystem::path& path)
    -> infra::Result<FileDescriptor>;

// Создаёт или обрезает файл назначения
[[nodiscard]] auto open_destination(const std::filesystem::path& path)
    -> infra::Result<FileDescriptor>;

/// One read() call. EOF is `bytes == 0` without `interrupted`.
[[nodiscard]] auto read_chunk(const FileDescriptor& fd, std::span<char> buffer)
    -> infra::Result<ReadChunk>;

/// Writes the whole buffer, resuming after EINTR and short writes.
[[nodiscard]] auto write_all(const FileDescriptor& fd, std::span<const char> data)
    -> infra::VoidResult;

// То же для чужого дескриптора (например, STDERR_FILENO)
[[nodiscard]] auto write_all(int fd, std::span<const char> data) -> infra::VoidResult;

/// Size of a regular file; nullopt for pipes, devices and anything whose
/// length is not known up front.
[[nodiscard]] auto probe_size(const std::filesystem::path& path) -> std::optional<std::uint64_t>;

} // namespace progcp::adapters::fs
