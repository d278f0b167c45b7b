#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace progcp::core {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Seconds = std::chrono::duration<double>;

/// Учётная запись одной передачи.
struct FileRecord {
    std::optional<std::uint64_t> size;      // nullopt: источник без размера (pipe, char device)
    std::optional<TimePoint> time_start;    // выставляется при advance()
    std::uint64_t bytes_done = 0;
};

/// Скорости в байтах в секунду. nullopt до первого валидного сэмпла.
struct Throughput {
    std::optional<double> instant;
    std::optional<double> average;
    std::optional<double> smoothed;
};

/// Счётчики байт и времени для текущего файла и всего батча.
///
/// Not thread-safe: all calls must come from the single thread that drives
/// the copy loop. Timestamps are always supplied by the caller.
class StatsTracker {
public:
    // Вес предыдущей оценки в EWMA, подобран под интервал ~0.5 с
    static constexpr double kSmoothingFactor = 0.8;

    StatsTracker() = default;

    /// Registers a pending transfer. A single unknown size makes the batch
    /// total unknown for good.
    void register_file(std::optional<std::uint64_t> size);

    /// Makes the next pending file current, retiring the previous one.
    /// Fails with NoMoreFiles when nothing is pending.
    [[nodiscard]] auto advance(TimePoint now) -> infra::VoidResult;

    /// Accounts `bytes_new` to the current file and updates the rates.
    /// Fails with NoActiveFile before the first advance().
    [[nodiscard]] auto record_sample(std::uint64_t bytes_new, TimePoint now) -> infra::VoidResult;

    /// End of batch: the current file, if any, moves to done.
    void finish();

    [[nodiscard]] auto done_count() const -> std::size_t { return done_.size(); }
    [[nodiscard]] auto pending_count() const -> std::size_t { return pending_.size(); }
    [[nodiscard]] auto has_current() const -> bool { return current_.has_value(); }
    [[nodiscard]] auto file_count() const -> std::size_t;
    // 1-based, 0 если активного файла нет
    [[nodiscard]] auto current_index() const -> std::size_t;

    [[nodiscard]] auto file_elapsed() const -> Seconds;
    [[nodiscard]] auto batch_elapsed() const -> Seconds;

    [[nodiscard]] auto file_bytes_done() const -> std::uint64_t;
    [[nodiscard]] auto file_size() const -> std::optional<std::uint64_t>;
    [[nodiscard]] auto total_bytes_done() const -> std::uint64_t { return total_bytes_done_; }
    [[nodiscard]] auto total_size() const -> std::optional<std::uint64_t> { return total_size_; }

    [[nodiscard]] auto throughput() const -> const Throughput& { return throughput_; }
    [[nodiscard]] auto last_sample_time() const -> std::optional<TimePoint> { return last_sample_time_; }

private:
    void update_rates_(std::uint64_t bytes_new, Seconds elapsed, Seconds total_elapsed);
    [[nodiscard]] auto since_(std::optional<TimePoint> start) const -> Seconds;

    std::deque<FileRecord> pending_;
    std::optional<FileRecord> current_;
    std::vector<FileRecord> done_;

    std::optional<TimePoint> batch_time_start_;
    std::optional<TimePoint> last_sample_time_;
    std::optional<std::uint64_t> total_size_{0};
    std::uint64_t total_bytes_done_ = 0;

    Throughput throughput_{};
};

} // namespace progcp::core
